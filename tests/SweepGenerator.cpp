/***********************************************************************************************************************
*                                                                                                                      *
* libgatehal                                                                                                           *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/


/**
	@file
	@brief Tests of sweep step generation and evaluation
 */

#include <catch2/catch.hpp>

#include "TestHelpers.h"

using namespace std;

TEST_CASE("SweepGenerator_ForwardAndBack")
{
	REQUIRE(SweepGenerator::ForwardAndBack(-1, 1, 3) == vector<double>{-1, 0, 1, 0});
	REQUIRE(SweepGenerator::ForwardAndBack(-2, 2, 5) == vector<double>{-2, -1, 0, 1, 2, 1, 0, -1});
	REQUIRE(SweepGenerator::ForwardAndBack(0.5, 1, 2) == vector<double>{0.5, 1});
	REQUIRE(SweepGenerator::ForwardAndBack(0.5, 1, 1) == vector<double>{0.5});
}

TEST_CASE("SweepGenerator_Linspace")
{
	REQUIRE(FormatValueList(SweepGenerator::Linspace(-1, 1, 5)) == "-1,-0.5,0,0.5,1");
	REQUIRE(FormatValueList(SweepGenerator::Linspace(-0.7, 0.15, 5)) == "-0.7,-0.4875,-0.275,-0.0625,0.15");

	//End point is hit exactly
	REQUIRE(SweepGenerator::Linspace(0, 0.3, 4).back() == 0.3);

	REQUIRE_THROWS_AS(SweepGenerator::Linspace(0, 1, 0), InvalidValueError);
}

TEST_CASE("SweepGenerator_Steps2DIsOuterMajor")
{
	auto steps = SweepGenerator::Steps2D("inner", {10, 20}, "outer", {0, 1});
	REQUIRE(steps.size() == 4);

	vector<double> inner;
	vector<double> outer;
	for(auto& s : steps)
	{
		inner.push_back(s.at("inner"));
		outer.push_back(s.at("outer"));
	}
	REQUIRE(inner == vector<double>{10, 20, 10, 20});
	REQUIRE(outer == vector<double>{0, 0, 1, 1});

	REQUIRE_THROWS_AS(SweepGenerator::Steps2D("gate", {1}, "gate", {2}), InvalidValueError);
}

TEST_CASE("SweepGenerator_StepsDetune")
{
	auto steps = SweepGenerator::StepsDetune({"a", "b"}, {-1, 2}, {1, -2}, 3);
	REQUIRE(steps.size() == 4);
	REQUIRE(steps[0].at("a") == -1);
	REQUIRE(steps[0].at("b") == 2);
	REQUIRE(steps[2].at("a") == 1);
	REQUIRE(steps[2].at("b") == -2);
	REQUIRE(steps[3].at("a") == 0);

	REQUIRE_THROWS_WITH(
		SweepGenerator::StepsDetune({"a", "b"}, {-1}, {1, -2}, 3),
		Catch::StartsWith("There must be exactly one voltage per contact: got"));
	REQUIRE_THROWS_AS(SweepGenerator::StepsDetune({"a"}, {-1}, {1, -2}, 3), InvalidValueError);
}

TEST_CASE_METHOD(QDAC2Fixture, "SweepGenerator_EvaluateThroughCorrection")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 1}, {"gate2", 2}});
	arrangement->InitiateCorrection("gate1", {1, 0.5});
	arrangement->SetVirtualVoltage("gate2", 1);

	auto points = SweepGenerator::Evaluate(*arrangement, SweepGenerator::Steps1D("gate1", {0, 1}));
	REQUIRE(points == PointTable{{0.5, 1}, {1.5, 1}});
	REQUIRE(SweepGenerator::Transpose(points) == PointTable{{0.5, 1.5}, {1, 1}});

	//Each step starts from the arrangement's virtual voltages, which are left alone
	REQUIRE(arrangement->GetVirtualVoltage("gate1") == 0);

	REQUIRE_THROWS_AS(
		SweepGenerator::Evaluate(*arrangement, SweepGenerator::Steps1D("gate3", {0})),
		UnknownContactError);

	auto restricted = SweepGenerator::Restrict(SweepGenerator::Steps2D("gate1", {0}, "gate3", {1}), *arrangement);
	REQUIRE(restricted.size() == 1);
	REQUIRE(restricted[0].size() == 1);
	REQUIRE(restricted[0].count("gate1") == 1);
}
