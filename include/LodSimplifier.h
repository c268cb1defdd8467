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
#ifndef _LODSIMPLIFIER_H
#define _LODSIMPLIFIER_H
#include "Geometry.h"
#include "Exception.h"

namespace coastlod{
/**
 * Douglas-Peucker simplification with a fixed tolerance (degrees)
 * tolerance 0 returns the input unchanged
 * The subdivision uses an explicit work stack, so the
 * stack depth does not depend on the ring size.
 */
class LodSimplifier{
    public:
    /**
     * throws AssertException for negative or non finite tolerances
     */
    explicit LodSimplifier(double tolerance);
    double getTolerance() const { return tolerance;}
    /**
     * simplify a ring
     * a closed ring is simplified without the closing point and closed again
     * if the result has less then MIN_RING_POINTS points
     * the original ring is returned
     */
    Ring simplifyRing(const Ring &ring) const;
    /**
     * simplify an open polyline, the original is returned
     * if less then 2 points would remain
     */
    Ring simplifyLine(const Ring &line) const;
    Polygon simplifyPolygon(const Polygon &polygon) const;
    GeometryCollection simplify(const GeometryCollection &collection) const;
    /**
     * distance of p to the segment a-b
     * the projection is clamped to the segment
     */
    static double segmentDistance(const Coord::LLXy &p, const Coord::LLXy &a, const Coord::LLXy &b);
    /**
     * the raw Douglas-Peucker on a point sequence with fixed endpoints
     */
    static Ring douglasPeucker(const Ring &points, double tolerance);
    private:
    double tolerance;
};
}

#endif
