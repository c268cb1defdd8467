/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Exceptions
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
#ifndef _EXCEPTION_H
#define _EXCEPTION_H
#include <exception>
#include <sstream>
#include <errno.h>
#include "Types.h"
#include "StringHelper.h"

typedef std::exception Exception;
#define DECL_EXC(Base,Name) class Name: public Base{ \
            using Base::Base; \
            public:\
                virtual const char *type()const noexcept override {return #Name;}\
            };
class CoastException : public std::exception{
    public:
        CoastException(const String &reason,int error=0){
            this->reason=reason;
            this->error=error;
        }
        CoastException(){}
        virtual const char * what() const noexcept override{
            return reason.c_str();
        }
        virtual const String msg() const noexcept{
            std::stringstream out;
            out << type();
            if (error != 0){
                out << "(" << error << "):";
            }
            else{
                out << ":";
            }
            out << reason;
            return out.str();
        }
        virtual int getError() const{
            return error;
        }
        virtual ~CoastException(){}
        virtual const char *type() const noexcept {return "CoastException";}
    protected:
        String reason;
        int error=0;    
};

class FileException: public CoastException{
    using CoastException::CoastException;
    protected:
    String fileName;
    public:
    String getFileName() const { return fileName;}
    FileException(const String &fn,const String &msg, int error=0): CoastException(msg,error),fileName(fn){}
    virtual const String msg() const noexcept override{
        if (fileName.empty()) return CoastException::msg();
        return "["+fileName+"]"+CoastException::msg();
    }
    virtual const char *type() const noexcept override {return "FileException";}
};

class AssertException : public CoastException{
    protected:
    String file;
    String func;
    int line=0;
    public:
    AssertException(const String &fu, const String &fi, int l,const String &txt):file(fi),func(fu),line(l){
        reason=txt;
    }
    virtual const String msg() const noexcept override{
        return FMT("Assertion: %s in %s(%s:%d)",reason,func,file,line);
    }
    virtual const char *type() const noexcept override {return "AssertException";}
};
//contract violations by the caller, always checked
#define COASTLOD_ASSERT(cond,text) {if (! (cond)) throw AssertException(__func__,__FILE__,__LINE__,text);}

#endif
