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

#ifndef FILEHELPER_H
#define FILEHELPER_H

#include <vector>
#include <memory>
#include "StringHelper.h"
#include "Exception.h"

class FileHelper{
public:
    static String concatPath(const String &p1, const String &p2);
    static String fileName(const String &path, bool stripExtension=false);
    static bool exists(const String &filename,bool directory=false);
    static int64_t fileSize(const String &name);
    static bool rename(const String &name, const String &newName);
    static bool unlink(const String &name);
    static bool makeDirs(const String &dir,int mode=0755);
    /**
     * read a complete file
     * throws FileException on any error
     */
    static DataVector readFile(const String &name);
    /**
     * write data to a temp file beside name and rename it
     * throws FileException on any error
     */
    static void writeFile(const String &name, const DataVector &data);
};


#endif /* FILEHELPER_H */
