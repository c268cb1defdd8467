/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  String helper tests
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
#include <StringHelper.h>
#include "TestHelper.h"
#include <sstream>

TEST(StringHelper,toLower){
    String t4("UpperCase Mixed");
    String t4s=StringHelper::toLower(t4);
    EXPECT_EQ(t4s,String("uppercase mixed"));
}
TEST(StringHelper,format){
    String t5("Some (%d) test for float(%.1f) and String(%s)");
    String t5s=StringHelper::format(t5.c_str(), 1, 0.3, String("aha").c_str());
    EXPECT_EQ(t5s,String("Some (1) test for float(0.3) and String(aha)"));
}
TEST(StringHelper,formatGeneral){
    EXPECT_EQ(FMT("tol=%g",0.00002),String("tol=2e-05"));
    EXPECT_EQ(FMT("%05d|%x",42,255),String("00042|ff"));
}
TEST(StringHelper,split){
    String t6("Some string to be split");
    StringVector rs = StringHelper::split(t6, " ");
    EXPECT_EQ(rs.size(),5);
    EXPECT_EQ(rs[0],String("Some"));
    EXPECT_EQ(rs[4],String("split"));
}
TEST(StringHelper,splitLimit){
    String t6("lod1:0.00002:x");
    StringVector rs = StringHelper::split(t6, ":",1);
    EXPECT_EQ(rs.size(),2);
    EXPECT_EQ(rs[0],String("lod1"));
    EXPECT_EQ(rs[1],String("0.00002:x"));
}
TEST(StringHelper,trim){
    EXPECT_EQ(StringHelper::trim("  lod1 "),String("lod1"));
    EXPECT_EQ(StringHelper::trim("   "),String(""));
    EXPECT_EQ(StringHelper::trim("xxaxx",'x'),String("a"));
}
TEST(StringHelper,concat){
    StringVector v={"a","b","c"};
    EXPECT_EQ(StringHelper::concat(v,","),String("a,b,c"));
    EXPECT_EQ(StringHelper::concat(StringVector(),","),String(""));
}
TEST(StringHelper,toDouble){
    double v=-1;
    EXPECT_TRUE(StringHelper::toDouble("0.00002",v));
    EXPECT_DOUBLE_EQ(v,0.00002);
    EXPECT_TRUE(StringHelper::toDouble(" 1e-3 ",v));
    EXPECT_DOUBLE_EQ(v,0.001);
    EXPECT_FALSE(StringHelper::toDouble("",v));
    EXPECT_FALSE(StringHelper::toDouble("1x",v));
    EXPECT_FALSE(StringHelper::toDouble("abc",v));
}
