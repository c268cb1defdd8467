/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  LOD generation command line tool
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

#include "Logger.h"
#include "Exception.h"
#include "FileHelper.h"
#include "StringHelper.h"
#include "Timer.h"
#include "Nvtl.h"
#include "LodPipeline.h"
#include <getopt.h>
#include <stdlib.h>
#include <iostream>

using namespace coastlod;

void usage (const char *name){
    std::cerr <<  "coastlod version " << TOSTRING(COASTLOD_VERSION) << std::endl;
    std::cerr <<  "Usage: " << name << " [...options...] input.nvtl outDir" << std::endl;
    std::cerr <<  "       -l logFile log file (default: stderr)" << std::endl;
    std::cerr <<  "       -d logLevel log level 0,1,2" << std::endl;
    std::cerr <<  "       -s source LOD ladder for a source (" << StringHelper::concat(LodLadder::knownSources(),",") << "), default: enc" << std::endl;
    std::cerr <<  "       -t ladder custom LOD ladder name:tolerance,name:tolerance,..." << std::endl;
    std::cerr <<  "       -n threads number of worker threads, 0: one per level (default)" << std::endl;
    std::cerr <<  "       -A do not remove rectangular artifacts" << std::endl;
    std::cerr <<  "       -M do not merge polygons" << std::endl;
}

int main(int argc, char **argv)
{
    String logFile;
    String source="enc";
    String ladderDefinition;
    int logLevel=LOG_LEVEL_INFO;
    PipelineOptions options;
    int opt;
    while ((opt = getopt(argc, argv, "l:d:s:t:n:AM")) != -1) {
        switch (opt) {
        case 'l':
            logFile=String(optarg);
            break;
        case 'd':
            logLevel=atoi(optarg);
            break;
        case 's':
            source=String(optarg);
            break;
        case 't':
            ladderDefinition=String(optarg);
            break;
        case 'n':
            options.numThreads=atoi(optarg);
            if (options.numThreads < 0) options.numThreads=0;
            break;
        case 'A':
            options.filterArtifacts=false;
            break;
        case 'M':
            options.mergePolygons=false;
            break;
        default: /* '?' */
            usage(argv[0]);
            return 1;
        }
    }
    if ((argc-optind) < 2){
        usage(argv[0]);
        return 1;
    }
    try{
        Logger::CreateInstance(logFile,logLevel);
        LOG_INFO("Start with param %s",StringHelper::concat(argv,argc));
        String input(argv[optind]);
        String outDir(argv[optind+1]);
        LodLadder ladder=ladderDefinition.empty()?
            LodLadder::forSource(source):
            LodLadder::parse(ladderDefinition);
        LOG_INFO("ladder %s",ladder.toString());
        if (! FileHelper::makeDirs(outDir)){
            LOG_ERRORC("unable to create directory %s",outDir);
            return -1;
        }
        Timer::SteadyTimePoint start=Timer::steadyNow();
        DataVector inputData=FileHelper::readFile(input);
        NvtlData decoded=NvtlDecoder::decode(inputData);
        GeometryCollection collection=decoded.toCollection();
        LOG_INFOC("read %d polygons from %s",(int)collection.size(),input);
        LodPipeline pipeline(options,ladder);
        LodPipeline::ResultList results=pipeline.run(collection);
        String baseName=FileHelper::fileName(input,true);
        for (const auto &result: results){
            String outName=FileHelper::concatPath(outDir,FMT("%s_%s.bin",baseName,result.level.name));
            FileHelper::writeFile(outName,result.data);
            LOG_INFOC("%s (tol=%g): %d polygons, %d points, %d bytes, %d ms -> %s",
                result.level.name,result.level.tolerance,
                (int)result.collection.numPolygons(),(int)result.pointCount,
                (int)result.data.size(),(int)result.millis,outName);
        }
        LOG_INFOC("Done in %d ms",(int)Timer::steadyDiffMillis(start));
    }catch (FileException &f){
        LOG_ERRORC("%s: %s",f.getFileName(),f.what());
        return -1;
    }catch (NvtlFormatException &n){
        LOG_ERRORC("%s",n.msg());
        return -2;
    }catch (CoastException &a){
        LOG_ERRORC("%s",a.msg());
        return -2;
    }catch (Exception &e){
        LOG_ERRORC("Unknown exception: %s",e.what());
        return -3;
    }
    return 0;
}
