/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Douglas-Peucker tests
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
#include <math.h>
#include "LodSimplifier.h"
#include "TestHelper.h"

using namespace coastlod;

TEST(LodSimplifier,SegmentDistance){
    Coord::LLXy a(0,0);
    Coord::LLXy b(2,0);
    EXPECT_DOUBLE_EQ(LodSimplifier::segmentDistance(Coord::LLXy(1,1),a,b),1.0);
    //beyond the end: distance to the endpoint, not to the infinite line
    EXPECT_DOUBLE_EQ(LodSimplifier::segmentDistance(Coord::LLXy(5,4),a,b),5.0);
    EXPECT_DOUBLE_EQ(LodSimplifier::segmentDistance(Coord::LLXy(-3,0),a,b),3.0);
    //degenerate segment
    EXPECT_DOUBLE_EQ(LodSimplifier::segmentDistance(Coord::LLXy(3,4),a,a),5.0);
}
TEST(LodSimplifier,ZeroIsIdentity){
    Ring r=TestHelper::noisyCircle(500,1,0.01);
    //collinear and duplicate points must survive as well
    Ring square=TestHelper::closedRing({{0,0},{0.5,0},{1,0},{1,0},{1,1},{0,1}});
    LodSimplifier simplifier(0);
    EXPECT_EQ(simplifier.simplifyRing(r),r);
    EXPECT_EQ(simplifier.simplifyRing(square),square);
    EXPECT_EQ(simplifier.simplifyLine(square),square);
}
TEST(LodSimplifier,CollinearRemoved){
    Ring r=TestHelper::closedRing({{0,0},{0.5,0},{1,0},{1,0.5},{1,1},{0.5,1},{0,1},{0,0.5}});
    Ring s=LodSimplifier(1e-6).simplifyRing(r);
    //start and last point before closure (0,0.5) are always kept
    ASSERT_EQ(s.size(),6u);
    EXPECT_EQ(s[1],Coord::LLXy(1,0));
    EXPECT_EQ(s[2],Coord::LLXy(1,1));
    EXPECT_EQ(s[3],Coord::LLXy(0,1));
    EXPECT_EQ(s[4],Coord::LLXy(0,0.5));
    EXPECT_TRUE(ringIsClosed(s));
    EXPECT_EQ(s.front(),Coord::LLXy(0,0));
}
TEST(LodSimplifier,PointsAreSubset){
    Ring r=TestHelper::noisyCircle(2000,1,0.02,7);
    for (double tol: {1e-4,1e-3,1e-2,5e-2}){
        Ring s=LodSimplifier(tol).simplifyRing(r);
        for (const auto &p: s){
            EXPECT_TRUE(TestHelper::containsPoint(r,p)) << "tolerance " << tol;
        }
    }
}
TEST(LodSimplifier,WithinTolerance){
    Ring r=TestHelper::noisyCircle(2000,1,0.02,3);
    for (double tol: {1e-4,1e-3,1e-2,5e-2}){
        Ring s=LodSimplifier(tol).simplifyRing(r);
        EXPECT_TRUE(ringIsClosed(s));
        EXPECT_LE(TestHelper::maxDeviation(r,s),tol+1e-12) << "tolerance " << tol;
    }
}
TEST(LodSimplifier,Monotonic){
    Ring r=TestHelper::noisyCircle(3000,1,0.01,11);
    size_t last=r.size();
    for (double tol: {0.0,1e-5,1e-4,1e-3,1e-2,5e-2,1e-1}){
        Ring s=LodSimplifier(tol).simplifyRing(r);
        EXPECT_LE(s.size(),last) << "tolerance " << tol;
        last=s.size();
    }
    EXPECT_GE(last,MIN_RING_POINTS);
}
TEST(LodSimplifier,StrictThreshold){
    Ring line=TestHelper::ring({{0,0},{1,0.5},{2,0}});
    EXPECT_EQ(LodSimplifier(0.5).simplifyLine(line).size(),2u);
    EXPECT_EQ(LodSimplifier(0.49).simplifyLine(line).size(),3u);
}
TEST(LodSimplifier,FallbackToOriginal){
    //a tiny ring would collapse to 3 points
    Ring r=TestHelper::rectangle(0,0,0.001,0.001);
    Ring s=LodSimplifier(0.01).simplifyRing(r);
    EXPECT_EQ(s,r);
}
TEST(LodSimplifier,Line){
    Ring line;
    for (int i=0;i<=100;i++){
        line.push_back(Coord::LLXy(i*0.01,(i%2)*1e-6));
    }
    Ring s=LodSimplifier(1e-5).simplifyLine(line);
    ASSERT_EQ(s.size(),2u);
    EXPECT_EQ(s.front(),line.front());
    EXPECT_EQ(s.back(),line.back());
}
TEST(LodSimplifier,InvalidTolerance){
    EXPECT_THROW(LodSimplifier(-1e-6),AssertException);
    EXPECT_THROW(LodSimplifier(NAN),AssertException);
    EXPECT_THROW((void)LodSimplifier(INFINITY),AssertException);
}
TEST(LodSimplifier,LargeRing){
    Ring r=TestHelper::noisyCircle(200000,1,1e-3,5);
    Ring s=LodSimplifier(1e-3).simplifyRing(r);
    EXPECT_TRUE(ringIsClosed(s));
    EXPECT_LT(s.size(),r.size());
    EXPECT_GE(s.size(),MIN_RING_POINTS);
}
TEST(LodSimplifier,ZigZagRing){
    //nearly every point is kept, deep subdivision
    Ring r;
    for (int i=0;i<50000;i++){
        r.push_back(Coord::LLXy(i*1e-3,(i%2)*1.0));
    }
    r.push_back(Coord::LLXy(50,-10));
    r.push_back(r.front());
    Ring s=LodSimplifier(1e-3).simplifyRing(r);
    EXPECT_GT(s.size(),r.size()*9/10);
    EXPECT_TRUE(ringIsClosed(s));
}
TEST(LodSimplifier,Collection){
    GeometryCollection c;
    NameValueMap props;
    props["src"]="a";
    Polygon p(TestHelper::noisyCircle(1000,1,0.01,1));
    p.interiors.push_back(TestHelper::noisyCircle(500,0.3,0.01,2));
    c.addPolygon(p,props);
    Ring line;
    for (int i=0;i<=10;i++) line.push_back(Coord::LLXy(i,0));
    c.addLine(line);
    c.push_back(Feature());
    LodSimplifier simplifier(1e-2);
    GeometryCollection r=simplifier.simplify(c);
    ASSERT_EQ(r.size(),3u);
    const Polygon *sp=r[0].polygon();
    ASSERT_NE(sp,nullptr);
    EXPECT_EQ(r[0].properties.at("src"),"a");
    EXPECT_LT(sp->exterior.size(),p.exterior.size());
    ASSERT_EQ(sp->interiors.size(),1u);
    EXPECT_LT(sp->interiors[0].size(),p.interiors[0].size());
    ASSERT_TRUE(r[1].isLine());
    EXPECT_EQ(r[1].line()->points.size(),2u);
    EXPECT_TRUE(r[2].isEmpty());
    EXPECT_LT(countPoints(r),countPoints(c));
}
