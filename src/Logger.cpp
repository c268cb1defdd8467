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
#include "Logger.h"
#include "Exception.h"
#include "SystemHelper.h"
#include "FileHelper.h"
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <thread>
#include <string>
#include <iostream>
#include <stdio.h>

class MStreamBuf : public std::streambuf
{
    typedef std::ptrdiff_t streamsize;

public:
    MStreamBuf(FILE *fp, bool ownsFile, bool lineFlush=true) : std::streambuf()
    {
        this->fp = fp;
        this->ownsFile=ownsFile;
        this->lineFlush=lineFlush;
    }
    ~MStreamBuf(){
        close();
    }
    virtual streamsize xsputn(const char *s, streamsize n)
    {
        if (! fp) return 0;
        return fwrite(s, 1,n, fp);
    }
    void close()
    {
        if (! fp) return;
        if (ownsFile) fclose(fp);
        else fflush(fp);
        fp = NULL;
    }
    virtual int_type
      overflow(int_type c  = traits_type::eof())
      { 
          if (! fp) return traits_type::eof();
          fputc(c,fp);
          if (lineFlush && c == '\n') {
              fflush(fp);
          }
          return c;
      }

private:
    FILE *fp;
    bool ownsFile=false;
    bool lineFlush=false;
};

std::unique_ptr<Logger> Logger::_instance;

Logger::Logger(const String &fileName):fileName(fileName){ 
}
Logger::~Logger(){
    Close();
}
bool Logger::Close(){
    Synchronized l(mutex);
    CloseNoLock();
    return true;
}
bool Logger::CloseNoLock()
{
    if (logStream)
    {
        logStream->flush();
        logStream.reset();
    }
    logBuffer.reset();
    return true;
}
static String getBackupName(){
    struct timeval tv;
    struct tm tm;
    gettimeofday(&tv,NULL);
    localtime_r(&tv.tv_sec,&tm);
    //"%Y-%m-%d-%H-%M-%S"
    return StringHelper::format(".%04d-%02d-%02d-%02d-%02d-%02d",
            tm.tm_year+1900,tm.tm_mon+1,tm.tm_mday,
            tm.tm_hour,tm.tm_min,tm.tm_sec);
}
void Logger::RenameFile(){
    if (FileHelper::exists(fileName)){
        String newName=fileName+getBackupName();
        if (! FileHelper::rename(fileName,newName)){
            std::cerr << "unable to rename logfile from "<<fileName << " to " << newName << std::endl;
        }
    }
}
bool Logger::OpenLogFile(){
    CloseNoLock();
    if (fileName.empty()){
        logBuffer=std::make_unique<MStreamBuf>(stderr,false);
        logStream=std::make_unique<std::ostream>(logBuffer.get());
        return true;
    }
    RenameFile();
    int fd=::open(fileName.c_str(),O_WRONLY|O_CLOEXEC|O_CREAT|O_TRUNC,0664);
    if (fd < 0){
        throw FileException(fileName,FMT("unable to open logfile: %s",SystemHelper::sysError()));
    }
    FILE *fp = fdopen(fd,"wb");
    if (! fp){
        ::close(fd);
        throw FileException(fileName,"unable to open logfile");
    }
    logBuffer=std::make_unique<MStreamBuf>(fp,true);
    logStream = std::make_unique<std::ostream>(logBuffer.get());
    return true;
}
void Logger::SetLevel(int l){
    level=l;
}

void Logger::WriteHeader(const char *cat){
    if (!initialized)
        return;
    if (!logStream)
        return;
    struct timeval tv;
    struct tm tm;
    gettimeofday(&tv, NULL);
    localtime_r(&tv.tv_sec, &tm);
    *logStream << StringHelper::format("%04d/%02d/%02d-%02d:%02d:%02d.%03d-",
                                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                                       tm.tm_hour, tm.tm_min, tm.tm_sec, (int)(tv.tv_usec / 1000L));
    *logStream << std::this_thread::get_id();
    *logStream << "-";
    *logStream << cat;
    *logStream << "-";
}

Logger *Logger::instance(){
    static Logger dummy("");
    if (_instance) return _instance.get();
    return &dummy;
}
void Logger::CreateInstance(const String &fileName,int level){
    std::unique_ptr<Logger> next(new Logger(fileName));
    next->OpenLogFile();
    next->level=level;
    next->initialized=true;
    _instance=std::move(next);
}
