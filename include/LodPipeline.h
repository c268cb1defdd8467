/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  LOD pipeline
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
#ifndef _LODPIPELINE_H
#define _LODPIPELINE_H
#include "Geometry.h"
#include "Exception.h"
#include "ArtifactFilter.h"
#include <vector>

namespace coastlod{

class LodLevel{
    public:
    String name;
    double tolerance=0;
    LodLevel(){}
    LodLevel(const String &n, double t):name(n),tolerance(t){}
};

/**
 * ordered list of LOD levels with non decreasing tolerances
 */
class LodLadder{
    public:
    typedef std::vector<LodLevel> LevelList;
    LodLadder(){}
    /**
     * throws CoastException if the levels are not valid
     */
    LodLadder(const LevelList &l);
    const LevelList & getLevels() const { return levels;}
    size_t size() const { return levels.size();}
    bool empty() const { return levels.empty();}
    const LodLevel & operator[](size_t i) const{ return levels[i];}
    String toString() const;
    /**
     * built in ladders: enc, encdirect, osm
     * throws CoastException for unknown sources
     */
    static LodLadder forSource(const String &source);
    static StringVector knownSources();
    /**
     * parse name:tolerance,name:tolerance,...
     * throws CoastException for syntax errors or invalid tolerances
     */
    static LodLadder parse(const String &definition);
    private:
    LevelList levels;
};

class PipelineOptions{
    public:
    bool filterArtifacts=true;
    bool mergePolygons=true;
    //convert lines into closed ring polygons before encoding
    bool closeLines=false;
    //0: one thread per level (at most one per cpu), 1: sequential
    int numThreads=0;
    ArtifactFilter::Config filterConfig;
};

class LodResult{
    public:
    LodLevel level;
    GeometryCollection collection;
    DataVector data;
    size_t pointCount=0;
    int64_t millis=0;
};

class LodPipeline{
    public:
    typedef std::vector<LodResult> ResultList;
    LodPipeline(const PipelineOptions &options, const LodLadder &ladder);
    /**
     * normalize, filter and merge
     * the result is the common input of all levels
     */
    GeometryCollection prepare(const GeometryCollection &collection) const;
    /**
     * compute all levels, results are ordered as the ladder
     * an exception from any level is rethrown after all workers finished
     */
    ResultList run(const GeometryCollection &collection) const;
    private:
    LodResult computeLevel(const LodLevel &level, const GeometryCollection &prepared) const;
    PipelineOptions options;
    LodLadder ladder;
};

}

#endif
