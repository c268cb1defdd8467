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
#ifndef _POLYGONMERGER_H
#define _POLYGONMERGER_H
#include "Geometry.h"

namespace coastlod{
/**
 * merge all polygon features into the minimal set of polygons
 * covering their union
 * non polygon features are appended after the merged ones
 * If the geometry engine fails the input is returned unchanged.
 */
class PolygonMerger{
    public:
    static const constexpr char * MERGED_PROPERTY="merged";
    class Stat{
        public:
        size_t inputPolygons=0;
        //self intersecting polygons split into valid parts
        size_t repairedPolygons=0;
        size_t invalidPolygons=0;
        size_t outputPolygons=0;
        bool failed=false;
    };
    virtual ~PolygonMerger(){}
    GeometryCollection merge(const GeometryCollection &collection, Stat *stat=nullptr) const;
    protected:
    /**
     * union of valid, closed polygons
     * throws if the geometry engine fails
     */
    virtual std::vector<Polygon> unite(const std::vector<Polygon> &parts) const;
};
}

#endif
