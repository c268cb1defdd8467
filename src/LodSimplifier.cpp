/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Douglas-Peucker simplification
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
#include "LodSimplifier.h"
#include "Exception.h"
#include <cmath>

namespace coastlod{

LodSimplifier::LodSimplifier(double tolerance):tolerance(tolerance){
    COASTLOD_ASSERT(std::isfinite(tolerance),FMT("invalid tolerance %f",tolerance));
    COASTLOD_ASSERT(tolerance >= 0,FMT("negative tolerance %f",tolerance));
}

double LodSimplifier::segmentDistance(const Coord::LLXy &p, const Coord::LLXy &a, const Coord::LLXy &b){
    double dx=b.x-a.x;
    double dy=b.y-a.y;
    double len2=dx*dx+dy*dy;
    if (len2 <= 0){
        //degenerate segment
        return std::hypot(p.x-a.x,p.y-a.y);
    }
    double t=((p.x-a.x)*dx+(p.y-a.y)*dy)/len2;
    if (t < 0) t=0;
    if (t > 1) t=1;
    double px=a.x+t*dx;
    double py=a.y+t*dy;
    return std::hypot(p.x-px,p.y-py);
}

namespace{
    class Segment{
        public:
        size_t begin;
        size_t end;
        Segment(size_t b, size_t e):begin(b),end(e){}
    };
}

Ring LodSimplifier::douglasPeucker(const Ring &points, double tolerance){
    size_t num=points.size();
    if (num < 3) return points;
    std::vector<bool> keep(num,false);
    keep[0]=true;
    keep[num-1]=true;
    std::vector<Segment> stack;
    stack.emplace_back(0,num-1);
    while (! stack.empty()){
        Segment seg=stack.back();
        stack.pop_back();
        if (seg.end <= seg.begin+1) continue;
        double maxDist=-1;
        size_t idxOfMax=seg.begin;
        const Coord::LLXy &a=points[seg.begin];
        const Coord::LLXy &b=points[seg.end];
        for (size_t i=seg.begin+1;i<seg.end;i++){
            double dist=segmentDistance(points[i],a,b);
            if (dist > maxDist){
                maxDist=dist;
                idxOfMax=i;
            }
        }
        if (maxDist > tolerance){
            keep[idxOfMax]=true;
            stack.emplace_back(seg.begin,idxOfMax);
            stack.emplace_back(idxOfMax,seg.end);
        }
    }
    Ring rt;
    for (size_t i=0;i<num;i++){
        if (keep[i]) rt.push_back(points[i]);
    }
    return rt;
}

Ring LodSimplifier::simplifyRing(const Ring &ring) const{
    if (tolerance == 0) return ring;
    bool closed=ringIsClosed(ring);
    Ring rt;
    if (closed){
        Ring open(ring.begin(),ring.end()-1);
        rt=douglasPeucker(open,tolerance);
        if (! rt.empty() && rt.front() != rt.back()){
            rt.push_back(rt.front());
        }
    }
    else{
        rt=douglasPeucker(ring,tolerance);
    }
    if (rt.size() < MIN_RING_POINTS) return ring;
    return rt;
}

Ring LodSimplifier::simplifyLine(const Ring &line) const{
    if (tolerance == 0) return line;
    Ring rt=douglasPeucker(line,tolerance);
    if (rt.size() < 2) return line;
    return rt;
}

Polygon LodSimplifier::simplifyPolygon(const Polygon &polygon) const{
    Polygon rt(simplifyRing(polygon.exterior));
    rt.interiors.reserve(polygon.interiors.size());
    for (const auto &hole: polygon.interiors){
        rt.interiors.push_back(simplifyRing(hole));
    }
    return rt;
}

GeometryCollection LodSimplifier::simplify(const GeometryCollection &collection) const{
    if (tolerance == 0) return collection;
    GeometryCollection rt;
    rt.reserve(collection.size());
    for (const auto &feature : collection){
        if (const Polygon *p=feature.polygon()){
            rt.addPolygon(simplifyPolygon(*p),feature.properties);
            continue;
        }
        if (const Line *l=feature.line()){
            rt.addLine(simplifyLine(l->points),feature.properties);
            continue;
        }
        rt.push_back(feature);
    }
    return rt;
}

}
