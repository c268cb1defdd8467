/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  File helper tests
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

#include <gtest/gtest.h>
#include <stdio.h>
#include "FileHelper.h"
#include "TestHelper.h"
#include <unistd.h>
#include <ghc/filesystem.hpp>

#define FSNS ghc::filesystem

TEST(FileHelper,fileName){
    EXPECT_EQ(FileHelper::fileName("/data/coast/wa_coastline_lod0.nvtl"),String("wa_coastline_lod0.nvtl"));
    EXPECT_EQ(FileHelper::fileName("/data/coast/wa_coastline_lod0.nvtl",true),String("wa_coastline_lod0"));
    EXPECT_EQ(FileHelper::concatPath("/data","x.bin"),String("/data/x.bin"));
}
TEST(FileHelper,writeRead){
    String name=TestHelper::tempFileName("fhwrite");
    DataVector data;
    for (int i=0;i<40000;i++) data.push_back((uint8_t)(i & 0xff));
    FileHelper::writeFile(name,data);
    EXPECT_TRUE(FileHelper::exists(name));
    EXPECT_FALSE(FileHelper::exists(name+".tmp"));
    EXPECT_EQ(FileHelper::fileSize(name),(int64_t)data.size());
    DataVector read=FileHelper::readFile(name);
    EXPECT_EQ(read,data);
    EXPECT_TRUE(FileHelper::unlink(name));
    EXPECT_FALSE(FileHelper::exists(name));
}
TEST(FileHelper,readMissing){
    String name=TestHelper::tempFileName("fhmissing");
    try{
        FileHelper::readFile(name);
        FAIL() << "exception expected";
    }catch (FileException &e){
        EXPECT_EQ(e.getFileName(),name);
    }
}
TEST(FileHelper,makeDirs){
    String base=TestHelper::tempFileName("fhdirs");
    String dir=FileHelper::concatPath(FileHelper::concatPath(base,"a"),"b");
    EXPECT_TRUE(FileHelper::makeDirs(dir));
    EXPECT_TRUE(FileHelper::exists(dir,true));
    //existing is fine
    EXPECT_TRUE(FileHelper::makeDirs(dir));
    String file=FileHelper::concatPath(dir,"f");
    FileHelper::writeFile(file,DataVector(3,1));
    EXPECT_FALSE(FileHelper::makeDirs(file));
    FSNS::remove_all(base);
}
