/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Geometry model
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
#include "Geometry.h"
#include "Logger.h"

namespace coastlod{

size_t GeometryCollection::numPolygons() const{
    size_t rt=0;
    for (const auto &f: *this){
        if (f.isPolygon()) rt++;
    }
    return rt;
}

bool ringIsClosed(const Ring &ring){
    if (ring.size() < 2) return false;
    return ring.front() == ring.back();
}

Ring closeRing(const Ring &ring){
    if (ring.empty()) return ring;
    if (ring.front() == ring.back()) return ring;
    Ring rt(ring);
    rt.push_back(ring.front());
    return rt;
}

bool ringIsDegenerate(const Ring &ring){
    size_t num=ring.size();
    if (num > 0 && ring.front() != ring.back()) num++;
    return num < MIN_RING_POINTS;
}

Coord::LLBox computeBounds(const GeometryCollection &collection){
    Coord::LLBox rt;
    for (const auto &feature : collection){
        const Polygon *p=feature.polygon();
        if (! p) continue;
        for (const auto &point: p->exterior){
            rt.extend(point);
        }
    }
    return rt;
}

size_t countPoints(const GeometryCollection &collection){
    size_t rt=0;
    for (const auto &feature : collection){
        if (const Polygon *p=feature.polygon()){
            rt+=p->exterior.size();
            for (const auto &hole: p->interiors){
                rt+=hole.size();
            }
            continue;
        }
        if (const Line *l=feature.line()){
            rt+=l->points.size();
        }
    }
    return rt;
}

GeometryCollection normalizeCollection(const GeometryCollection &collection){
    GeometryCollection rt;
    rt.reserve(collection.size());
    int droppedFeatures=0;
    int droppedHoles=0;
    for (const auto &feature : collection){
        const Polygon *p=feature.polygon();
        if (! p){
            if (feature.isEmpty()){
                droppedFeatures++;
                continue;
            }
            rt.push_back(feature);
            continue;
        }
        if (ringIsDegenerate(p->exterior)){
            LOG_DEBUG("dropping feature with degenerate exterior of %d points",(int)p->exterior.size());
            droppedFeatures++;
            continue;
        }
        Polygon np(closeRing(p->exterior));
        for (const auto &hole : p->interiors){
            if (ringIsDegenerate(hole)){
                LOG_DEBUG("dropping degenerate hole of %d points",(int)hole.size());
                droppedHoles++;
                continue;
            }
            np.interiors.push_back(closeRing(hole));
        }
        rt.addPolygon(np,feature.properties);
    }
    if (droppedFeatures || droppedHoles){
        LOG_DEBUG("normalize: dropped %d features, %d holes",droppedFeatures,droppedHoles);
    }
    return rt;
}

GeometryCollection closeLines(const GeometryCollection &collection){
    GeometryCollection rt;
    rt.reserve(collection.size());
    for (const auto &feature : collection){
        const Line *l=feature.line();
        if (! l){
            rt.push_back(feature);
            continue;
        }
        if (l->points.size() < 2){
            LOG_DEBUG("dropping line with %d points",(int)l->points.size());
            continue;
        }
        rt.addPolygon(Polygon(closeRing(l->points)),feature.properties);
    }
    return rt;
}

}
