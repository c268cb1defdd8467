/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Geometry model tests
 * Author:   coastlod developers
 *
 ***************************************************************************
 *   Copyright (C) 2024 by the coastlod developers                         *
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
#include "Geometry.h"
#include "TestHelper.h"

using namespace coastlod;

TEST(Geometry,CloseRingAppendsFirst){
    Ring r=TestHelper::ring({{0,0},{1,0},{1,1}});
    Ring closed=closeRing(r);
    ASSERT_EQ(closed.size(),4u);
    EXPECT_EQ(closed.front(),closed.back());
    EXPECT_EQ(closed[0],Coord::LLXy(0,0));
}
TEST(Geometry,CloseRingNoop){
    Ring r=TestHelper::closedRing({{0,0},{1,0},{1,1}});
    EXPECT_EQ(closeRing(r).size(),r.size());
}
TEST(Geometry,CloseRingBitwise){
    //the last point differs in the last bit
    Ring r=TestHelper::ring({{0,0},{1,0},{1,1},{0,1e-300}});
    EXPECT_EQ(closeRing(r).size(),5u);
}
TEST(Geometry,Degenerate){
    EXPECT_TRUE(ringIsDegenerate(Ring()));
    EXPECT_TRUE(ringIsDegenerate(TestHelper::ring({{0,0},{1,0}})));
    EXPECT_TRUE(ringIsDegenerate(TestHelper::closedRing({{0,0},{1,0}})));
    EXPECT_FALSE(ringIsDegenerate(TestHelper::ring({{0,0},{1,0},{1,1}})));
    EXPECT_FALSE(ringIsDegenerate(TestHelper::closedRing({{0,0},{1,0},{1,1}})));
}
TEST(Geometry,BoxExtend){
    Coord::LLBox box;
    EXPECT_FALSE(box.valid);
    box.extend(Coord::LLXy(1,2));
    EXPECT_TRUE(box.valid);
    box.extend(Coord::LLXy(-1,5));
    EXPECT_EQ(box.xmin,-1);
    EXPECT_EQ(box.xmax,1);
    EXPECT_EQ(box.ymin,2);
    EXPECT_EQ(box.ymax,5);
    EXPECT_DOUBLE_EQ(box.width(),2);
    EXPECT_DOUBLE_EQ(box.height(),3);
}
TEST(Geometry,BoundsExteriorOnly){
    GeometryCollection c;
    Polygon p(TestHelper::rectangle(0,0,2,2));
    //holes never extend the bounds
    p.interiors.push_back(TestHelper::rectangle(5,5,6,6));
    c.addPolygon(p);
    c.addPolygon(Polygon(TestHelper::rectangle(-1,1,1,3)));
    c.addLine(TestHelper::ring({{100,100},{101,101}}));
    Coord::LLBox b=computeBounds(c);
    ASSERT_TRUE(b.valid);
    EXPECT_EQ(b,Coord::LLBox(-1,0,2,3));
}
TEST(Geometry,BoundsEmpty){
    GeometryCollection c;
    EXPECT_FALSE(computeBounds(c).valid);
    c.addLine(TestHelper::ring({{1,1},{2,2}}));
    EXPECT_FALSE(computeBounds(c).valid);
}
TEST(Geometry,CountPoints){
    GeometryCollection c;
    Polygon p(TestHelper::rectangle(0,0,2,2));
    p.interiors.push_back(TestHelper::rectangle(0.5,0.5,1,1));
    c.addPolygon(p);
    c.addLine(TestHelper::ring({{1,1},{2,2},{3,3}}));
    EXPECT_EQ(countPoints(c),13u);
}
TEST(Geometry,MultiPolygonFlattened){
    GeometryCollection c;
    NameValueMap props;
    props["source"]="cell1";
    c.addMultiPolygon({Polygon(TestHelper::rectangle(0,0,1,1)),Polygon(TestHelper::rectangle(2,2,3,3))},props);
    ASSERT_EQ(c.size(),2u);
    EXPECT_EQ(c[0].properties["source"],"cell1");
    EXPECT_EQ(c[1].properties["source"],"cell1");
    EXPECT_EQ(c.numPolygons(),2u);
}
TEST(Geometry,Normalize){
    GeometryCollection c;
    //open ring gets closed
    Polygon open(TestHelper::ring({{0,0},{1,0},{1,1},{0,1}}));
    //degenerate hole is dropped, valid hole stays
    open.interiors.push_back(TestHelper::ring({{0.1,0.1},{0.2,0.1}}));
    open.interiors.push_back(TestHelper::ring({{0.2,0.2},{0.4,0.2},{0.4,0.4}}));
    c.addPolygon(open);
    //degenerate exterior drops the feature
    c.addPolygon(Polygon(TestHelper::ring({{5,5},{6,6}})));
    c.push_back(Feature());
    c.addLine(TestHelper::ring({{1,1},{2,2}}));
    GeometryCollection n=normalizeCollection(c);
    ASSERT_EQ(n.size(),2u);
    const Polygon *p=n[0].polygon();
    ASSERT_NE(p,nullptr);
    EXPECT_EQ(p->exterior.size(),5u);
    EXPECT_TRUE(ringIsClosed(p->exterior));
    ASSERT_EQ(p->interiors.size(),1u);
    EXPECT_EQ(p->interiors[0].size(),4u);
    EXPECT_TRUE(n[1].isLine());
    //input is not modified
    EXPECT_EQ(c[0].polygon()->exterior.size(),4u);
}
TEST(Geometry,CloseLines){
    GeometryCollection c;
    c.addLine(TestHelper::ring({{0,0},{1,0},{1,1}}));
    c.addLine(TestHelper::ring({{0,0}}));
    c.addPolygon(Polygon(TestHelper::rectangle(0,0,1,1)));
    GeometryCollection r=closeLines(c);
    ASSERT_EQ(r.size(),2u);
    ASSERT_TRUE(r[0].isPolygon());
    EXPECT_EQ(r[0].polygon()->exterior.size(),4u);
    EXPECT_TRUE(ringIsClosed(r[0].polygon()->exterior));
    EXPECT_TRUE(r[1].isPolygon());
}
