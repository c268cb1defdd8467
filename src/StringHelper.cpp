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
#include "StringHelper.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdlib.h>

StringVector StringHelper::split(const String &in, const String &sep, int max)
{
    StringVector rt;
    if (sep.empty()) return rt;
    size_t pos = 0;
    while (max == 0 || (int)rt.size() < max)
    {
        size_t found = in.find(sep, pos);
        if (found == String::npos) break;
        rt.push_back(in.substr(pos, found - pos));
        pos = found + sep.size();
    }
    if (pos < in.size()) rt.push_back(in.substr(pos));
    return rt;
}

String StringHelper::toLower(const String &in){
    String rt(in);
    std::transform(rt.begin(), rt.end(), rt.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return rt;
}

String StringHelper::trim(const String &in, unsigned char v){
    size_t start=in.find_first_not_of((char)v);
    if (start == String::npos) return String();
    size_t end=in.find_last_not_of((char)v);
    return in.substr(start,end-start+1);
}

String StringHelper::concat(const StringVector &data,const char *delim){
    String rt;
    for (size_t i=0;i<data.size();i++){
        if (i > 0) rt.append(delim);
        rt.append(data[i]);
    }
    return rt;
}
String StringHelper::concat(const char **data,int len,const char *delim){
    StringVector parts;
    for (int i=0;i<len;i++){
        if (data[i]) parts.push_back(data[i]);
    }
    return concat(parts,delim);
}

bool StringHelper::toDouble(const String &in, double &out){
    String v=trim(in);
    if (v.empty()) return false;
    char *end=nullptr;
    double rt=::strtod(v.c_str(),&end);
    if (end == nullptr || *end != 0) return false;
    out=rt;
    return true;
}

/**
 * translate one printf conversion (flags - and 0, width, precision, l/z
 * length modifiers, s c d i u x f e g) into stream settings
 * fmt is advanced behind the conversion character
 */
StringHelper::StreamSave StringHelper::HandleFormatValue(std::ostream &stream, const char **fmt)
{
    StreamSave rt;
    const char *p=*fmt;
    if (*p != '%') return rt;
    p++;
    std::ios_base::fmtflags flags=stream.flags() &
        ~(std::ios::adjustfield | std::ios::basefield | std::ios::floatfield);
    char fill=stream.fill();
    for (;*p == '-' || *p == '0';p++){
        if (*p == '-') flags |= std::ios::left;
        else{
            flags |= std::ios::internal;
            fill='0';
        }
    }
    int width=0;
    while (isdigit(*p)) width=width*10+(*p++ - '0');
    std::streamsize precision=stream.precision();
    if (*p == '.'){
        p++;
        precision=0;
        while (isdigit(*p)) precision=precision*10+(*p++ - '0');
    }
    while (*p == 'l' || *p == 'z') p++;
    if (*p == 0){
        *fmt=p;
        return rt;
    }
    rt.formatType=*p;
    bool known=true;
    switch(*p){
        case 's':
        case 'c':
            break;
        case 'd':
        case 'i':
        case 'u':
            flags |= std::ios::dec;
            break;
        case 'x':
            flags |= std::ios::hex;
            break;
        case 'f':
            flags |= std::ios::fixed;
            break;
        case 'e':
            flags |= std::ios::scientific;
            break;
        case 'g':
            break;
        default:
            //unknown conversion, value is written unformatted
            known=false;
    }
    p++;
    *fmt=p;
    if (! known) return rt;
    rt.get(stream);
    rt.mustSet=true;
    stream.flags(flags);
    stream.fill(fill);
    stream.width(width);
    stream.precision(precision);
    return rt;
}
