/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Removal of tile boundary artifacts
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
#include "ArtifactFilter.h"
#include "Logger.h"
#include <math.h>

namespace coastlod{

double ArtifactFilter::ringArea(const Ring &closedRing){
    if (closedRing.size() < 2) return 0;
    size_t n=closedRing.size()-1;
    double area=0;
    for (size_t i=0;i<n;i++){
        size_t j=(i+1)%n;
        area+=closedRing[i].x*closedRing[j].y;
        area-=closedRing[j].x*closedRing[i].y;
    }
    return fabs(area)/2.0;
}

bool ArtifactFilter::isArtifact(const Feature &feature) const{
    const Polygon *p=feature.polygon();
    if (! p) return false;
    return isArtifact(*p);
}

bool ArtifactFilter::isArtifact(const Polygon &polygon) const{
    Ring exterior=closeRing(polygon.exterior);
    if (exterior.size() < config.minPoints || exterior.size() > config.maxPoints) return false;
    Coord::LLBox box;
    for (const auto &point:exterior){
        box.extend(point);
    }
    if (box.width() < config.minExtent || box.height() < config.minExtent) return false;
    double boxArea=box.area();
    double ratio=boxArea > 0 ? ringArea(exterior)/boxArea : 0;
    if (ratio > config.areaRatio) return true;
    if (exterior.size() == 5){
        int aligned=0;
        for (size_t i=0;i<4;i++){
            double dx=fabs(exterior[i].x-exterior[i+1].x);
            double dy=fabs(exterior[i].y-exterior[i+1].y);
            if (dx < config.axisTolerance || dy < config.axisTolerance) aligned++;
        }
        if (aligned == 4) return true;
    }
    return false;
}

GeometryCollection ArtifactFilter::filter(const GeometryCollection &collection, size_t *removed) const{
    GeometryCollection rt;
    rt.reserve(collection.size());
    size_t numRemoved=0;
    for (const auto &feature:collection){
        if (isArtifact(feature)){
            numRemoved++;
            continue;
        }
        rt.push_back(feature);
    }
    if (removed) *removed=numRemoved;
    LOG_INFO("artifact filter: removed %lld of %lld features",(long long)numRemoved,(long long)collection.size());
    return rt;
}

}
