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
#ifndef _NVTL_H
#define _NVTL_H
#include "Geometry.h"
#include "Exception.h"

namespace coastlod{

/**
 * NVTL layout, little endian, no padding
 * "NVTL" u16 version u32 polygons 4*f64 bounds(minlon,minlat,maxlon,maxlat)
 * per polygon: u32 exteriorPoints u32 holes exteriorPoints*(f64 lon,f64 lat)
 *   per hole: u32 points points*(f64 lon, f64 lat)
 */
static const constexpr char NVTL_MAGIC[4]={'N','V','T','L'};
static const constexpr uint16_t NVTL_VERSION=1;
static const constexpr size_t NVTL_HEADER_SIZE=4+2+4+4*8;
static const constexpr size_t NVTL_POINT_SIZE=2*8;

DECL_EXC(CoastException,NvtlFormatException);
//bad magic or unsupported version
DECL_EXC(NvtlFormatException,NvtlNotNvtlException);
//buffer ends before the declared data
DECL_EXC(NvtlFormatException,NvtlTruncatedException);

class NvtlData{
    public:
    uint16_t version=NVTL_VERSION;
    Coord::LLBox bounds;
    std::vector<Polygon> polygons;
    GeometryCollection toCollection() const;
};

class NvtlEncoder{
    public:
    /**
     * encode all polygon features, other features are skipped
     * an empty collection results in a header with zero bounds
     */
    static DataVector encode(const GeometryCollection &collection);
    /**
     * the exact number of bytes encode will produce
     */
    static size_t encodedSize(const GeometryCollection &collection);
};

class NvtlDecoder{
    public:
    /**
     * throws NvtlNotNvtlException or NvtlTruncatedException
     */
    static NvtlData decode(const DataVector &data);
    static NvtlData decode(const uint8_t *data, size_t len);
};

}

#endif
