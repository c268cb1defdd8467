/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Logging
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
#ifndef _LOGGER_H
#define _LOGGER_H

#include <sys/time.h>
#include <iostream>
#include <memory>
#include <atomic>
#include <utility>
#include "SimpleThread.h"
#include "StringHelper.h"

#define LOG_LEVEL_ERROR 0
#define LOG_LEVEL_INFO 1
#define LOG_LEVEL_DEBUG 2

#define LOG_INFO(...) if(Logger::instance()->HasLevel(LOG_LEVEL_INFO)) Logger::instance()->Log(LOG_LEVEL_INFO,"INFO",__VA_ARGS__);
#define LOG_INFOC(...) {StringHelper::StreamFormat(std::cout,__VA_ARGS__);std::cout << std::endl;if(Logger::instance()->HasLevel(LOG_LEVEL_INFO)) Logger::instance()->Log(LOG_LEVEL_INFO,"INFO",__VA_ARGS__);}
#define LOG_DEBUG(...) if(Logger::instance()->HasLevel(LOG_LEVEL_DEBUG)) Logger::instance()->Log(LOG_LEVEL_DEBUG,"DEBUG",__VA_ARGS__)
#define LOG_ERROR(...) if(Logger::instance()->HasLevel(LOG_LEVEL_ERROR)) Logger::instance()->Log(LOG_LEVEL_ERROR,"ERROR",__VA_ARGS__)
#define LOG_ERRORC(...) {StringHelper::StreamFormat(std::cerr,__VA_ARGS__);std::cerr << std::endl;if(Logger::instance()->HasLevel(LOG_LEVEL_ERROR)) Logger::instance()->Log(LOG_LEVEL_ERROR,"ERROR", __VA_ARGS__);}
class MStreamBuf;
/**
 * process wide logger
 * before CreateInstance has been called all output is dropped
 * an empty file name logs to stderr
 */
class Logger {
private:
    static std::unique_ptr<Logger> _instance;
    bool initialized=false;
    std::atomic<int> level{LOG_LEVEL_INFO};
    long currentLines=0;
    String fileName;
    std::unique_ptr<MStreamBuf> logBuffer;
    std::unique_ptr<std::ostream> logStream;
    std::mutex mutex;
    Logger(const String &fileName);
    void WriteHeader(const char *cat);
    bool OpenLogFile();
    void RenameFile();
    bool CloseNoLock();
public:
    ~Logger();
    bool Close();
    template<typename ...Args>
    void Log(int level, const char *cat,const char * fmt, Args&& ...args){
        if (! initialized) return;
        Synchronized l(mutex);
        if (! logStream) return;
        if (!this->HasLevel(level)) return;
        WriteHeader(cat);
        StringHelper::StreamFormat(*logStream,fmt,std::forward<Args>(args)...);
        *logStream << std::endl;
        currentLines++;
    }
    void SetLevel(int level);
    inline bool HasLevel(int level) const{
        return this->level >= level;
    }
    long GetLines() const{ return currentLines;}
    static Logger *instance();
    /**
     * (re)create the logger
     * throws FileException if the log file cannot be opened
     */
    static void CreateInstance(const String &fileName,int level=LOG_LEVEL_INFO);
};


#endif 
