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
#ifndef _GEOMETRY_H
#define _GEOMETRY_H
#include "Types.h"
#include "StringHelper.h"
#include <variant>
#include <vector>

namespace Coord
{
    template <typename T>
    class Point{
        public:
        T x;
        T y;
        Point():x(0),y(0){}
        Point(const T &xp,const T &yp):x(xp),y(yp){}
        void shift(T sx, T sy){
            x+=sx;
            y+=sy;
        }
        //bitwise compare, no tolerance
        bool operator == (const Point<T> &other) const{
            return x==other.x && y==other.y;
        }
        bool operator != (const Point<T> &other) const{
            return ! (*this == other); 
        }
    }; 
    /**
     * lon/lat in degrees (WGS84)
     * x is the longitude, y the latitude
     */
    typedef double LatLon;
    typedef Point<LatLon> LLXy;

    template <typename T>
    class Box
    {
    public:
        bool valid = false;
        T xmin = 0;
        T xmax = 0;
        T ymin = 0;
        T ymax = 0;
        Box() {}
        Box(T x0, T y0, T x1, T y1):valid(true),xmin(x0),xmax(x1),ymin(y0),ymax(y1){}
        T width() const { return xmax-xmin;}
        T height() const { return ymax-ymin;}
        T area() const { return width()*height();}
        bool extend(const Point<T> &point)
        {
            if (! valid){
                xmin=point.x;
                xmax=point.x;
                ymin=point.y;
                ymax=point.y;
                valid=true;
                return true;
            }
            bool changed = false;
            if (point.x < xmin)
            {
                xmin = point.x;
                changed = true;
            }
            if (point.y < ymin)
            {
                ymin = point.y;
                changed = true;
            }
            if (point.x > xmax)
            {
                xmax = point.x;
                changed = true;
            }
            if (point.y > ymax)
            {
                ymax = point.y;
                changed = true;
            }
            return changed;
        }
        String toString() const{
            return FMT("Box(%s,xmin=%.8f,ymin=%.8f,xmax=%.8f,ymax=%.8f)",(valid?"valid":"invalid"),xmin,ymin,xmax,ymax);
        }
        bool operator == (const Box<T> &other) const{
            return valid == other.valid && xmin == other.xmin && ymin == other.ymin
                && xmax == other.xmax && ymax == other.ymax;
        }
    };
    typedef Box<LatLon> LLBox;
}

namespace coastlod{

typedef std::vector<Coord::LLXy> Ring;

class Polygon{
    public:
    Ring exterior;
    std::vector<Ring> interiors;
    Polygon(){}
    Polygon(const Ring &ext):exterior(ext){}
    Polygon(const Ring &ext,const std::vector<Ring> &holes):exterior(ext),interiors(holes){}
};

/**
 * an open polyline, only present until the
 * pipeline decides how to represent it
 */
class Line{
    public:
    Ring points;
    Line(){}
    Line(const Ring &p):points(p){}
};

typedef std::variant<std::monostate,Polygon,Line> Geometry;

class Feature{
    public:
    Geometry geometry;
    //provenance only, never used for geometric decisions
    NameValueMap properties;
    Feature(){}
    Feature(const Geometry &g,const NameValueMap &p=NameValueMap()):geometry(g),properties(p){}
    bool isPolygon() const { return std::holds_alternative<Polygon>(geometry);}
    bool isLine() const { return std::holds_alternative<Line>(geometry);}
    bool isEmpty() const { return std::holds_alternative<std::monostate>(geometry);}
    const Polygon * polygon() const { return std::get_if<Polygon>(&geometry);}
    Polygon * polygon() { return std::get_if<Polygon>(&geometry);}
    const Line * line() const { return std::get_if<Line>(&geometry);}
    Line * line() { return std::get_if<Line>(&geometry);}
};

class GeometryCollection : public std::vector<Feature>{
    public:
    using std::vector<Feature>::vector;
    void addPolygon(const Polygon &p,const NameValueMap &properties=NameValueMap()){
        emplace_back(p,properties);
    }
    void addLine(const Ring &points,const NameValueMap &properties=NameValueMap()){
        emplace_back(Line(points),properties);
    }
    /**
     * flatten a multipolygon into one feature per member
     * all members share the same properties
     */
    void addMultiPolygon(const std::vector<Polygon> &polygons,const NameValueMap &properties=NameValueMap()){
        for (const auto &p : polygons){
            emplace_back(p,properties);
        }
    }
    size_t numPolygons() const;
};

//minimal number of points of a closed ring
static const constexpr size_t MIN_RING_POINTS=4;

bool ringIsClosed(const Ring &ring);
/**
 * append the first point if the last one differs (bitwise)
 */
Ring closeRing(const Ring &ring);
/**
 * fewer than MIN_RING_POINTS points after closure
 */
bool ringIsDegenerate(const Ring &ring);
/**
 * bounds of all exterior ring points of the polygon features
 * returns an invalid box if there are no points
 */
Coord::LLBox computeBounds(const GeometryCollection &collection);
/**
 * number of points in all rings and lines
 */
size_t countPoints(const GeometryCollection &collection);
/**
 * close all polygon rings, drop degenerate rings
 * a degenerate exterior drops the feature
 */
GeometryCollection normalizeCollection(const GeometryCollection &collection);
/**
 * convert lines into polygons by closing them back to their start
 * lines with less then 2 points are dropped
 */
GeometryCollection closeLines(const GeometryCollection &collection);

}

#endif
