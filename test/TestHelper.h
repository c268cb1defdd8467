/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Test helper
 * Author:   Andreas Vogel
 *
 ***************************************************************************
 *   Copyright (C) 2024 by Andreas Vogel   *
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
#ifndef TESTHELPER_H
#define TESTHELPER_H
#include <initializer_list>
#include <utility>
#include "Geometry.h"
#include "Exception.h"

#define IN_RANGE(v,compare,percent) \
    { \
    double cvmin=compare * (100.0-percent)/100.0; \
    double cvmax=compare * (100.0+percent)/100.0;\
    if (cvmin > cvmax){ double t=cvmax;cvmax=cvmin;cvmin=t;}\
    EXPECT_LE(v,cvmax) << "mus be between " << cvmin << " and " << cvmax; \
    EXPECT_GE(v,cvmin) << "mus be between " << cvmin << " and " << cvmax; \
    }

namespace TestHelper{
    typedef std::initializer_list<std::pair<double,double>> PointList;
    //ring from lon,lat pairs, not closed
    coastlod::Ring ring(PointList points);
    //closed ring
    coastlod::Ring closedRing(PointList points);
    //closed axis aligned rectangle
    coastlod::Ring rectangle(double x0, double y0, double x1, double y1);
    coastlod::Polygon polygon(PointList exterior);
    /**
     * closed ring around a circle with some radial noise
     * deterministic for a given seed
     */
    coastlod::Ring noisyCircle(size_t numPoints, double radius, double noise, unsigned int seed=1);
    //max distance of any point of original to the polyline simplified
    double maxDeviation(const coastlod::Ring &original, const coastlod::Ring &simplified);
    bool containsPoint(const coastlod::Ring &ring, const Coord::LLXy &point);
    //unsigned area of a polygon, holes subtracted
    double polygonArea(const coastlod::Polygon &polygon);
    String tempFileName(const String &prefix);
}

#endif
