/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Union of land polygons
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
#include "PolygonMerger.h"
#include "Logger.h"
#include "Timer.h"
#include "Exception.h"
#include <algorithm>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/segment.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>

namespace bg = boost::geometry;

namespace coastlod{

using BPoint        = bg::model::d2::point_xy<double>;
using BSegment      = bg::model::segment<BPoint>;
using BPolygon      = bg::model::polygon<BPoint>;
using BMultiPolygon = bg::model::multi_polygon<BPolygon>;
using BRing         = BPolygon::ring_type;

static BRing toBoost(const Ring &ring){
    BRing rt;
    rt.reserve(ring.size());
    for (const auto &p: ring){
        rt.push_back(BPoint(p.x,p.y));
    }
    return rt;
}
static BPolygon toBoost(const Polygon &polygon){
    BPolygon rt;
    rt.outer()=toBoost(polygon.exterior);
    for (const auto &hole: polygon.interiors){
        rt.inners().push_back(toBoost(hole));
    }
    return rt;
}
static Ring fromBoost(const BRing &ring){
    Ring rt;
    rt.reserve(ring.size());
    for (const auto &p: ring){
        rt.push_back(Coord::LLXy(p.x(),p.y()));
    }
    return closeRing(rt);
}
static Polygon fromBoost(const BPolygon &polygon){
    Polygon rt(fromBoost(polygon.outer()));
    for (const auto &inner: polygon.inners()){
        if (inner.empty()) continue;
        rt.interiors.push_back(fromBoost(inner));
    }
    return rt;
}

static bool samePoint(const BPoint &a, const BPoint &b){
    return a.x() == b.x() && a.y() == b.y();
}

/**
 * pairwise (cascaded) union to keep the intermediate results small
 */
static BMultiPolygon cascadedUnion(std::vector<BMultiPolygon> &parts){
    if (parts.empty()) return BMultiPolygon();
    while (parts.size() > 1){
        std::vector<BMultiPolygon> next;
        next.reserve(parts.size()/2+1);
        for (size_t i=0;i<parts.size();i+=2){
            if ((i+1) >= parts.size()){
                next.push_back(std::move(parts[i]));
                continue;
            }
            BMultiPolygon res;
            bg::union_(parts[i],parts[i+1],res);
            next.push_back(std::move(res));
        }
        parts.swap(next);
    }
    return parts[0];
}

/**
 * insert every point where the closed ring crosses or touches itself
 * as a vertex into all segments it lies on
 * the same point value is inserted on both segments so that the
 * split in splitRing finds it again by exact compare
 */
static BRing nodeRing(const BRing &ring){
    if (ring.size() < MIN_RING_POINTS) return ring;
    size_t numSegments=ring.size()-1;
    std::vector<std::vector<BPoint>> nodes(numSegments);
    for (size_t i=0;i<numSegments;i++){
        BSegment first(ring[i],ring[i+1]);
        for (size_t k=i+1;k<numSegments;k++){
            std::vector<BPoint> crossings;
            bg::intersection(first,BSegment(ring[k],ring[k+1]),crossings);
            for (const auto &c: crossings){
                if (! samePoint(c,ring[i]) && ! samePoint(c,ring[i+1])) nodes[i].push_back(c);
                if (! samePoint(c,ring[k]) && ! samePoint(c,ring[k+1])) nodes[k].push_back(c);
            }
        }
    }
    BRing rt;
    for (size_t i=0;i<numSegments;i++){
        rt.push_back(ring[i]);
        std::vector<BPoint> &segmentNodes=nodes[i];
        const BPoint &start=ring[i];
        std::sort(segmentNodes.begin(),segmentNodes.end(),[&start](const BPoint &a,const BPoint &b){
            return bg::comparable_distance(start,a) < bg::comparable_distance(start,b);
        });
        for (const auto &node: segmentNodes){
            if (! samePoint(node,rt.back())) rt.push_back(node);
        }
    }
    rt.push_back(ring[0]);
    return rt;
}

static void addLoop(std::vector<BPoint>::const_iterator begin, std::vector<BPoint>::const_iterator end,
        std::vector<BMultiPolygon> &loops){
    BPolygon loop;
    loop.outer().assign(begin,end);
    loop.outer().push_back(*begin);
    if (loop.outer().size() < MIN_RING_POINTS) return;
    bg::correct(loop);
    if (bg::area(loop) <= 0 || ! bg::is_valid(loop)) return;
    BMultiPolygon part;
    part.push_back(std::move(loop));
    loops.push_back(std::move(part));
}

/**
 * split a self intersecting ring into simple loops at the points
 * it visits more than once and return the union of the loops
 * zero area loops (collinear back and forth parts) are dropped
 */
static BMultiPolygon splitRing(const BRing &ring){
    BRing noded=nodeRing(ring);
    std::vector<BMultiPolygon> loops;
    std::vector<BPoint> path;
    for (size_t i=0;(i+1) < noded.size();i++){
        const BPoint &p=noded[i];
        auto found=std::find_if(path.begin(),path.end(),[&p](const BPoint &o){
            return samePoint(o,p);
        });
        if (found == path.end()){
            path.push_back(p);
            continue;
        }
        addLoop(found,path.end(),loops);
        path.erase(found+1,path.end());
    }
    if (! path.empty()) addLoop(path.begin(),path.end(),loops);
    return cascadedUnion(loops);
}

/**
 * coerce a polygon into valid polygons
 * self intersecting rings are split at their crossings,
 * holes are subtracted from the repaired exterior
 * returns false if nothing valid is left
 */
static bool repair(const Polygon &polygon, BMultiPolygon &out, bool &split){
    split=false;
    out.clear();
    BPolygon bp=toBoost(polygon);
    bg::unique(bp);
    bg::remove_spikes(bp);
    bg::correct(bp);
    if (bp.outer().size() < MIN_RING_POINTS) return false;
    if (bg::is_valid(bp)){
        out.push_back(std::move(bp));
        return true;
    }
    split=true;
    BMultiPolygon exterior=splitRing(bp.outer());
    std::vector<BMultiPolygon> holes;
    for (const auto &inner: bp.inners()){
        if (inner.size() < MIN_RING_POINTS) continue;
        holes.push_back(splitRing(inner));
    }
    BMultiPolygon holeArea=cascadedUnion(holes);
    if (holeArea.empty()){
        out=std::move(exterior);
    }
    else{
        bg::difference(exterior,holeArea,out);
    }
    std::string reason;
    if (out.empty() || ! bg::is_valid(out,reason)){
        LOG_DEBUG("merger: dropping invalid polygon: %s",reason);
        out.clear();
        return false;
    }
    return true;
}

std::vector<Polygon> PolygonMerger::unite(const std::vector<Polygon> &parts) const{
    std::vector<BMultiPolygon> boostParts;
    boostParts.reserve(parts.size());
    for (const auto &part: parts){
        BMultiPolygon mp;
        mp.push_back(toBoost(part));
        boostParts.push_back(std::move(mp));
    }
    BMultiPolygon merged=cascadedUnion(boostParts);
    std::vector<Polygon> rt;
    rt.reserve(merged.size());
    for (const auto &bp: merged){
        if (bp.outer().empty()) continue;
        rt.push_back(fromBoost(bp));
    }
    return rt;
}

GeometryCollection PolygonMerger::merge(const GeometryCollection &collection, Stat *stat) const{
    Stat localStat;
    if (! stat) stat=&localStat;
    *stat=Stat();
    Timer::SteadyTimePoint start=Timer::steadyNow();
    GeometryCollection others;
    std::vector<Polygon> merged;
    try{
        std::vector<Polygon> parts;
        for (const auto &feature: collection){
            const Polygon *p=feature.polygon();
            if (! p){
                others.push_back(feature);
                continue;
            }
            stat->inputPolygons++;
            BMultiPolygon valid;
            bool split=false;
            if (! repair(*p,valid,split)){
                stat->invalidPolygons++;
                continue;
            }
            if (split) stat->repairedPolygons++;
            for (const auto &bp: valid){
                parts.push_back(fromBoost(bp));
            }
        }
        merged=unite(parts);
    }catch (Exception &e){
        LOG_ERROR("merger: union failed, keeping unmerged geometry: %s",e.what());
        stat->failed=true;
        return collection;
    }
    GeometryCollection rt;
    rt.reserve(merged.size()+others.size());
    NameValueMap properties;
    properties[MERGED_PROPERTY]="true";
    for (const auto &polygon: merged){
        rt.addPolygon(polygon,properties);
    }
    stat->outputPolygons=rt.size();
    for (const auto &o: others){
        rt.push_back(o);
    }
    LOG_INFO("merger: %lld polygons (%lld repaired, %lld invalid) merged into %lld in %lld ms",
        (long long)stat->inputPolygons,(long long)stat->repairedPolygons,
        (long long)stat->invalidPolygons,(long long)stat->outputPolygons,
        (long long)Timer::steadyDiffMillis(start));
    return rt;
}

}
