/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  NVTL binary format
 * Author:   coastlod developers
 *
 ***************************************************************************
 *   Copyright (C) 2024 by the coastlod developers                         *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 2 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301,  USA.             *
 ***************************************************************************
 *
 */
#include "Nvtl.h"
#include "Logger.h"
#include <string.h>

namespace coastlod{

namespace{
class NvtlWriter{
    DataVector &buffer;
    public:
    NvtlWriter(DataVector &b):buffer(b){}
    void putBytes(const char *data, size_t len){
        buffer.insert(buffer.end(),(const uint8_t*)data,(const uint8_t*)data+len);
    }
    template <typename UT>
    void putUnsigned(UT v){
        for (size_t i=0;i<sizeof(UT);i++){
            buffer.push_back((uint8_t)(v & 0xff));
            v=v>>8;
        }
    }
    void putDouble(double v){
        uint64_t raw;
        memcpy(&raw,&v,sizeof(raw));
        putUnsigned(raw);
    }
    void putRing(const Ring &ring){
        for (const auto &p:ring){
            putDouble(p.x);
            putDouble(p.y);
        }
    }
};

class NvtlReader{
    const uint8_t *data;
    size_t fill;
    size_t bufferPtr=0;
    public:
    NvtlReader(const uint8_t *d, size_t len):data(d),fill(len){}
    size_t available() const{
        return fill-bufferPtr;
    }
    void check(size_t requested,const char *info) const{
        if (bufferPtr+requested > fill) throw NvtlTruncatedException(
            FMT("buffer too short, expected %d bytes at offset %d [%s], available %d",
                requested,bufferPtr,info,fill-bufferPtr));
    }
    void skip(size_t len,const char *info){
        check(len,info);
        bufferPtr+=len;
    }
    template <typename UT>
    UT getUnsigned(const char *info){
        check(sizeof(UT),info);
        UT rt=0;
        for (size_t i=0;i<sizeof(UT);i++){
            rt|=((UT)data[bufferPtr+i]) << (8*i);
        }
        bufferPtr+=sizeof(UT);
        return rt;
    }
    double getDouble(const char *info){
        uint64_t raw=getUnsigned<uint64_t>(info);
        double rt;
        memcpy(&rt,&raw,sizeof(rt));
        return rt;
    }
    Ring getRing(uint32_t numPoints, const char *info){
        //check before allocating to avoid huge allocations for corrupt counts
        check((size_t)numPoints*NVTL_POINT_SIZE,info);
        Ring rt;
        rt.reserve(numPoints);
        for (uint32_t i=0;i<numPoints;i++){
            double lon=getDouble(info);
            double lat=getDouble(info);
            rt.push_back(Coord::LLXy(lon,lat));
        }
        return rt;
    }
};
}

size_t NvtlEncoder::encodedSize(const GeometryCollection &collection){
    size_t rt=NVTL_HEADER_SIZE;
    for (const auto &feature: collection){
        const Polygon *p=feature.polygon();
        if (! p) continue;
        rt+=8+p->exterior.size()*NVTL_POINT_SIZE;
        for (const auto &hole:p->interiors){
            rt+=4+hole.size()*NVTL_POINT_SIZE;
        }
    }
    return rt;
}

DataVector NvtlEncoder::encode(const GeometryCollection &collection){
    size_t numPolygons=collection.numPolygons();
    COASTLOD_ASSERT(numPolygons <= UINT32_MAX,"too many polygons for NVTL");
    Coord::LLBox bounds=computeBounds(collection);
    if (numPolygons > 0){
        COASTLOD_ASSERT(bounds.valid,"no points in a non empty collection");
    }
    else{
        bounds=Coord::LLBox(0,0,0,0);
    }
    DataVector rt;
    rt.reserve(encodedSize(collection));
    NvtlWriter writer(rt);
    writer.putBytes(NVTL_MAGIC,sizeof(NVTL_MAGIC));
    writer.putUnsigned<uint16_t>(NVTL_VERSION);
    writer.putUnsigned<uint32_t>((uint32_t)numPolygons);
    writer.putDouble(bounds.xmin);
    writer.putDouble(bounds.ymin);
    writer.putDouble(bounds.xmax);
    writer.putDouble(bounds.ymax);
    for (const auto &feature: collection){
        const Polygon *p=feature.polygon();
        if (! p) continue;
        writer.putUnsigned<uint32_t>((uint32_t)p->exterior.size());
        writer.putUnsigned<uint32_t>((uint32_t)p->interiors.size());
        writer.putRing(p->exterior);
        for (const auto &hole:p->interiors){
            writer.putUnsigned<uint32_t>((uint32_t)hole.size());
            writer.putRing(hole);
        }
    }
    return rt;
}

NvtlData NvtlDecoder::decode(const DataVector &data){
    return decode(data.data(),data.size());
}

NvtlData NvtlDecoder::decode(const uint8_t *data, size_t len){
    if (len >= sizeof(NVTL_MAGIC) && memcmp(data,NVTL_MAGIC,sizeof(NVTL_MAGIC)) != 0){
        throw NvtlNotNvtlException("invalid magic");
    }
    NvtlReader reader(data,len);
    if (len < NVTL_HEADER_SIZE){
        throw NvtlTruncatedException(FMT("buffer of %d bytes shorter than header",len));
    }
    NvtlData rt;
    reader.skip(sizeof(NVTL_MAGIC),"magic");
    rt.version=reader.getUnsigned<uint16_t>("version");
    if (rt.version != NVTL_VERSION){
        throw NvtlNotNvtlException(FMT("unsupported version %d",rt.version),rt.version);
    }
    uint32_t numPolygons=reader.getUnsigned<uint32_t>("count");
    double minLon=reader.getDouble("bounds");
    double minLat=reader.getDouble("bounds");
    double maxLon=reader.getDouble("bounds");
    double maxLat=reader.getDouble("bounds");
    rt.bounds=Coord::LLBox(minLon,minLat,maxLon,maxLat);
    //each polygon needs at least its 2 counts
    reader.check((size_t)numPolygons*8,"polygons");
    rt.polygons.reserve(numPolygons);
    for (uint32_t i=0;i<numPolygons;i++){
        uint32_t numExterior=reader.getUnsigned<uint32_t>("exterior count");
        uint32_t numHoles=reader.getUnsigned<uint32_t>("hole count");
        Polygon p(reader.getRing(numExterior,"exterior"));
        reader.check((size_t)numHoles*4,"holes");
        p.interiors.reserve(numHoles);
        for (uint32_t h=0;h<numHoles;h++){
            uint32_t numPoints=reader.getUnsigned<uint32_t>("hole point count");
            p.interiors.push_back(reader.getRing(numPoints,"hole"));
        }
        rt.polygons.push_back(std::move(p));
    }
    if (reader.available() > 0){
        LOG_DEBUG("nvtl: ignoring %d trailing bytes",reader.available());
    }
    return rt;
}

GeometryCollection NvtlData::toCollection() const{
    GeometryCollection rt;
    rt.addMultiPolygon(polygons);
    return rt;
}

}
