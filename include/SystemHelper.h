/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  System helper
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
#ifndef SYSTEMHELPER_H
#define SYSTEMHELPER_H
#include "Types.h"
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <thread>

class SystemHelper
{
public:
    static String sysError(int error = -1)
    {
        char buffer[256];
        buffer[0] = 0;
        if (error == -1)
            error = errno;
        char *ept = strerror_r(error, buffer, 255);
        return String(ept);
    }
    //number of cpus, at least 1
    static int numCpus(){
        unsigned int rt=std::thread::hardware_concurrency();
        if (rt < 1){
            long cfg=sysconf(_SC_NPROCESSORS_ONLN);
            if (cfg < 1) return 1;
            return (int)cfg;
        }
        return (int)rt;
    }
};

#endif /* SYSTEMHELPER_H */
