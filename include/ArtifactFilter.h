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
#ifndef _ARTIFACTFILTER_H
#define _ARTIFACTFILTER_H
#include "Geometry.h"

namespace coastlod{
/**
 * detect rectangular polygons that are chart cell or tile
 * boundaries instead of real coastline
 * only the geometry is considered, never the properties
 * Be aware that small rectangular natural features
 * (e.g. a harbor basin) will be classified as artifacts as well.
 */
class ArtifactFilter{
    public:
    class Config{
        public:
        //point range (after closure) of candidates
        size_t minPoints=4;
        size_t maxPoints=10;
        //boxes with a smaller width or height are never artifacts
        double minExtent=1e-4;
        //polygon area/box area above this: artifact
        double areaRatio=0.95;
        //an edge is axis aligned if dx or dy is below this
        double axisTolerance=1e-3;
    };
    ArtifactFilter(){}
    ArtifactFilter(const Config &c):config(c){}
    bool isArtifact(const Feature &feature) const;
    bool isArtifact(const Polygon &polygon) const;
    /**
     * keep all features that are not artifacts
     * @param removed if not null: number of removed features
     */
    GeometryCollection filter(const GeometryCollection &collection, size_t *removed=nullptr) const;
    const Config & getConfig() const { return config;}
    /**
     * area of a closed ring (shoelace) without the closing point
     */
    static double ringArea(const Ring &closedRing);
    private:
    Config config;
};
}

#endif
