/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  String helper
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

#ifndef STRINGHELPER_H
#define STRINGHELPER_H

#include <vector>
#include <iostream>
#include <sstream>
#include <utility>
#include <string.h>
#include "Types.h"


#define FMT StringHelper::format

class StringHelper{
public:
    template<typename ...Args>
    static String format(const char *format,Args&& ...args){
        thread_local std::stringstream stream;
        stream.clear();
        stream.str(String());
        StreamFormat(stream,format,std::forward<Args>(args)...);
        return stream.str();
    }
    static StringVector split(const String &in, const String &sep, int max=0);
    static String toLower(const String&in);
    static String trim(const String &in,unsigned char v=' ');
    static String concat(const StringVector &data,const char *delim=" ");
    static String concat(const char **data,int len,const char *delim=" ");
    static String concat(char **data,int len,const char *delim=" "){
        return concat((const char **)data,len,delim );
    }
    /**
     * parse a double, the complete string must be consumed
     * returns false for empty or invalid input
     */
    static bool toDouble(const String &in, double &out);
    static void StreamFormat(std::ostream &stream,const char *fmt){
        stream << fmt;
    }
    template<typename T, typename ...Args>
    static void StreamFormat(std::ostream &stream,const char *fmt, T&& p1,Args&& ...args){
        const char *start=fmt;
        const char *p=fmt;
        while (*p!= 0){
            if (*p == '%'){
                if (*(p+1) == '%'){
                    p++; //write one % to stream
                    if (p != start ){
                        stream.write(start,p-start);
                    }
                    p++; //point after second %
                    start=p;
                    continue;
                }
                if (p != start ){
                    stream.write(start,p-start);
                }
                StreamSave old=HandleFormatValue(stream,&p);
                stream << std::forward<T>(p1);
                old.set(stream);
                StreamFormat(stream,p,std::forward<Args>(args)...);
                return;
            }
            else{
                p++;
            }
        }
        //we did not find any %
        stream.write(fmt,p-fmt);
    }

    private:
    class StreamSave{
        public:
        std::ios_base::fmtflags flags;
        char fill;
        int width;
        char formatType=0;
        std::streamsize precision;
        bool mustSet=false;  
        void set(std::ostream &stream){
            if (! mustSet) return;
            stream.flags(flags);
            stream.fill(fill);
            stream.precision(precision);
            stream.width(width);
        }
        void get(std::ostream &stream){
            flags = stream.flags();
            width = stream.width();
            fill = stream.fill();
            precision = stream.precision();
        }
    };
    static StreamSave HandleFormatValue(std::ostream &stream, const char **fmt);
};

#endif /* STRINGHELPER_H */
