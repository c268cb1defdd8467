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
#include "LodPipeline.h"
#include "PolygonMerger.h"
#include "LodSimplifier.h"
#include "Nvtl.h"
#include "Logger.h"
#include "Timer.h"
#include "SimpleThread.h"
#include "SystemHelper.h"
#include <atomic>
#include <algorithm>
#include <exception>
#include <cmath>

namespace coastlod{

namespace{
    class LadderPreset{
        public:
        const char *source;
        double tolerances[6];
    };
    //tolerances for lod0...lod5, finer for denser sources
    static const LadderPreset presets[]={
        {"enc",       {0, 2e-5, 5e-5, 1e-4, 3e-4, 1e-3}},
        {"encdirect", {0, 5e-5, 1e-4, 3e-4, 8e-4, 2e-3}},
        {"osm",       {0, 5e-6, 2e-5, 5e-5, 2e-4, 8e-4}},
        {"noaa",      {0, 2e-4, 5e-4, 1e-3, 3e-3, 8e-3}},
    };
}

LodLadder::LodLadder(const LevelList &l):levels(l){
    double last=0;
    for (const auto &level: levels){
        if (level.name.empty()){
            throw CoastException("empty LOD level name");
        }
        if (! std::isfinite(level.tolerance) || level.tolerance < 0){
            throw CoastException(FMT("invalid tolerance %f for level %s",level.tolerance,level.name));
        }
        if (level.tolerance < last){
            throw CoastException(FMT("tolerance %f for level %s is smaller than the previous one",level.tolerance,level.name));
        }
        last=level.tolerance;
    }
}

String LodLadder::toString() const{
    StringVector parts;
    for (const auto &level: levels){
        parts.push_back(FMT("%s:%g",level.name,level.tolerance));
    }
    return StringHelper::concat(parts,",");
}

StringVector LodLadder::knownSources(){
    StringVector rt;
    for (const auto &preset: presets){
        rt.push_back(preset.source);
    }
    return rt;
}

LodLadder LodLadder::forSource(const String &source){
    String name=StringHelper::toLower(source);
    for (const auto &preset: presets){
        if (name != preset.source) continue;
        LevelList levels;
        int idx=0;
        for (double tolerance : preset.tolerances){
            levels.push_back(LodLevel(FMT("lod%d",idx),tolerance));
            idx++;
        }
        return LodLadder(levels);
    }
    throw CoastException(FMT("unknown source %s, known: %s",source,StringHelper::concat(knownSources(),",")));
}

LodLadder LodLadder::parse(const String &definition){
    LevelList levels;
    StringVector parts=StringHelper::split(definition,",");
    for (const auto &part: parts){
        StringVector nv=StringHelper::split(part,":",1);
        if (nv.size() != 2){
            throw CoastException(FMT("invalid level definition \"%s\", expected name:tolerance",part));
        }
        String name=StringHelper::trim(nv[0]);
        double tolerance=0;
        if (! StringHelper::toDouble(nv[1],tolerance)){
            throw CoastException(FMT("invalid tolerance \"%s\" for level %s",nv[1],name));
        }
        levels.push_back(LodLevel(name,tolerance));
    }
    if (levels.empty()){
        throw CoastException("empty LOD ladder");
    }
    return LodLadder(levels);
}

LodPipeline::LodPipeline(const PipelineOptions &options, const LodLadder &ladder):
    options(options),ladder(ladder){
    if (ladder.empty()){
        throw CoastException("no LOD levels");
    }
}

GeometryCollection LodPipeline::prepare(const GeometryCollection &collection) const{
    Timer::Measure measure;
    GeometryCollection rt=normalizeCollection(collection);
    measure.add("normalize");
    if (options.filterArtifacts){
        ArtifactFilter filter(options.filterConfig);
        rt=filter.filter(rt);
        measure.add("filter");
    }
    if (options.mergePolygons){
        PolygonMerger merger;
        rt=merger.merge(rt);
        measure.add("merge");
    }
    if (options.closeLines){
        rt=closeLines(rt);
        measure.add("closeLines");
    }
    LOG_DEBUG("prepare: %s",measure.toString());
    LOG_INFO("prepared %lld features (%lld points) from %lld input features",
        (long long)rt.size(),(long long)countPoints(rt),(long long)collection.size());
    return rt;
}

LodResult LodPipeline::computeLevel(const LodLevel &level, const GeometryCollection &prepared) const{
    Timer::SteadyTimePoint start=Timer::steadyNow();
    LodResult rt;
    rt.level=level;
    LodSimplifier simplifier(level.tolerance);
    rt.collection=simplifier.simplify(prepared);
    rt.pointCount=countPoints(rt.collection);
    rt.data=NvtlEncoder::encode(rt.collection);
    rt.millis=Timer::steadyDiffMillis(start);
    LOG_INFO("level %s (tol=%g): %lld points, %lld bytes, %lld ms",
        level.name,level.tolerance,(long long)rt.pointCount,
        (long long)rt.data.size(),(long long)rt.millis);
    return rt;
}

LodPipeline::ResultList LodPipeline::run(const GeometryCollection &collection) const{
    GeometryCollection prepared=prepare(collection);
    size_t numLevels=ladder.size();
    ResultList rt(numLevels);
    size_t numThreads=options.numThreads > 0?(size_t)options.numThreads:
        std::min(numLevels,(size_t)SystemHelper::numCpus());
    if (numThreads > numLevels) numThreads=numLevels;
    if (numThreads <= 1){
        for (size_t i=0;i<numLevels;i++){
            rt[i]=computeLevel(ladder[i],prepared);
        }
        return rt;
    }
    std::vector<std::exception_ptr> errors(numLevels);
    std::atomic<size_t> nextLevel(0);
    {
        std::vector<Thread::Ptr> workers;
        for (size_t t=0;t<numThreads;t++){
            workers.push_back(std::make_shared<Thread>([this,&rt,&errors,&nextLevel,&prepared,numLevels](){
                while (true){
                    size_t idx=nextLevel++;
                    if (idx >= numLevels) return;
                    try{
                        rt[idx]=computeLevel(ladder[idx],prepared);
                    }catch (...){
                        errors[idx]=std::current_exception();
                    }
                }
            }));
        }
        LOG_DEBUG("starting %lld workers for %lld levels",(long long)numThreads,(long long)numLevels);
        for (auto &w:workers) w->start();
        for (auto &w:workers) w->join();
    }
    for (size_t i=0;i<numLevels;i++){
        if (errors[i]){
            LOG_ERROR("level %s failed",ladder[i].name);
            std::rethrow_exception(errors[i]);
        }
    }
    return rt;
}

}
