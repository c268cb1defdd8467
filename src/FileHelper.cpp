/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  File helper
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
#include "FileHelper.h"
#include "SystemHelper.h"
#include "Logger.h"
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <string.h>
#include <fcntl.h>

#include <sstream>
#include <ghc/filesystem.hpp>

#define FSNS ghc::filesystem

#define PATH_SEP "/"

String FileHelper::concatPath(const String &p1, const String &p2){
    std::stringstream out;
    out << p1;
    out << PATH_SEP;
    out << p2;
    return out.str();
}
String FileHelper::fileName(const String &path, bool stripExtension){
    if (path.empty()) return path;
    FSNS::path p(path);
    if (stripExtension) return p.stem().string();
    return p.filename().string();
}
bool FileHelper::exists(const String &filename, bool directory){
    struct stat64 buffer;
    if (stat64(filename.c_str(),&buffer) != 0) return false;
    if (S_ISDIR(buffer.st_mode)) return directory;
    return ! directory;
}
int64_t FileHelper::fileSize(const String &name){
    struct stat64 data;
    int rt=stat64(name.c_str(), &data);
    if (rt < 0) return -1;
    return data.st_size;
}
bool FileHelper::rename(const String &name, const String &newName){
    int rt=::rename(name.c_str(),newName.c_str());
    return rt == 0;
}
bool FileHelper::unlink(const String &name){
    return ::unlink(name.c_str()) == 0;
}

bool FileHelper::makeDirs(const String &dir, int mode){
    if (dir.empty()) return false;
    FSNS::path p(dir);
    FSNS::path current;
    std::error_code ec;
    for (auto it=p.begin();it != p.end();it++){
        ec.clear();
        if (current.empty()) current=*it;
        else current.append(*it);
        auto stat=FSNS::status(current,ec);
        if (ec || ! FSNS::exists(stat)){
            //use mkdir directly as we want to set the mode
            int res=mkdir(current.c_str(),mode);
            if (res != 0 && errno != EEXIST) return false;
            if (! exists(current.string(),true)){
                return false;
            }
        }
        else{
            if (!FSNS::is_directory(stat)){
                return false;
            }
        }
    }
    return true;
}

DataVector FileHelper::readFile(const String &name){
    if (name.empty()) throw FileException(name,"filename is empty for read");
    int fd=::open(name.c_str(),O_RDONLY|O_CLOEXEC);
    if (fd < 0){
        throw FileException(name,FMT("unable to open: %s",SystemHelper::sysError()),errno);
    }
    coastlod::VoidGuard closer([fd](){::close(fd);});
    DataVector rt;
    int64_t expected=fileSize(name);
    if (expected > 0) rt.reserve(expected);
    unsigned char buffer[16384];
    while (true){
        ssize_t rd=::read(fd,buffer,sizeof(buffer));
        if (rd < 0){
            if (errno == EINTR) continue;
            throw FileException(name,FMT("read error: %s",SystemHelper::sysError()),errno);
        }
        if (rd == 0) break;
        rt.insert(rt.end(),buffer,buffer+rd);
    }
    LOG_DEBUG("read %lld bytes from %s",(long long)rt.size(),name);
    return rt;
}

void FileHelper::writeFile(const String &name, const DataVector &data){
    if (name.empty()) throw FileException(name,"filename is empty for write");
    String tmpName=name+".tmp";
    int fd=::open(tmpName.c_str(),O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC,0644);
    if (fd < 0){
        throw FileException(tmpName,FMT("unable to open for writing: %s",SystemHelper::sysError()),errno);
    }
    {
        coastlod::VoidGuard closer([fd](){::close(fd);});
        size_t written=0;
        while (written < data.size()){
            ssize_t wr=::write(fd,data.data()+written,data.size()-written);
            if (wr < 0){
                if (errno == EINTR) continue;
                int err=errno;
                unlink(tmpName);
                throw FileException(tmpName,FMT("write error: %s",SystemHelper::sysError(err)),err);
            }
            written+=wr;
        }
    }
    if (! rename(tmpName,name)){
        int err=errno;
        unlink(tmpName);
        throw FileException(name,FMT("unable to rename from %s: %s",tmpName,SystemHelper::sysError(err)),err);
    }
    LOG_DEBUG("written %lld bytes to %s",(long long)data.size(),name);
}
