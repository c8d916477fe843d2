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
	@brief Tests of the command sequences emitted by QDAC2Channel
 */

#include <catch2/catch.hpp>

#include "TestHelpers.h"

#include <cmath>

using namespace std;

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2Channel_SetVoltageNow")
{
	m_qdac->GetQDAC2Channel(3).SetVoltageNow(0.5);
	REQUIRE(Commands() == vector<string>{
		"sour3:volt:mode fix",
		"sour3:volt 0.5"
		});

	REQUIRE_THROWS_AS(m_qdac->GetQDAC2Channel(3).SetVoltageNow(10.5), InvalidValueError);
	REQUIRE_THROWS_AS(m_qdac->GetQDAC2Channel(3).SetVoltageNow(NAN), InvalidValueError);
	REQUIRE(Commands().empty());
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2Channel_LoadList")
{
	auto& ch = m_qdac->GetQDAC2Channel(3);

	SECTION("Defaults")
	{
		ch.LoadList({-1, 0, 1}, 1e-5);
		REQUIRE(Commands() == vector<string>{
			"sour3:dc:trig:sour hold",
			"sour3:volt:mode list",
			"sour3:list:volt -1,0,1",
			"sour3:list:tmod auto",
			"sour3:list:dwel 1e-05",
			"sour3:dc:del 0",
			"sour3:list:dir up",
			"sour3:list:coun 1",
			"sour3:dc:trig:sour bus",
			"sour3:dc:init:cont on"
			});
	}

	SECTION("Stepped backwards forever")
	{
		ch.LoadList({0.25, 0.5}, 0.002, -1, true, true, 0.001);
		REQUIRE(Commands() == vector<string>{
			"sour3:dc:trig:sour hold",
			"sour3:volt:mode list",
			"sour3:list:volt 0.25,0.5",
			"sour3:list:tmod step",
			"sour3:list:dwel 0.002",
			"sour3:dc:del 0.001",
			"sour3:list:dir down",
			"sour3:list:coun -1",
			"sour3:dc:trig:sour bus",
			"sour3:dc:init:cont on"
			});
	}

	SECTION("Bad arguments send nothing")
	{
		REQUIRE_THROWS_AS(ch.LoadList(vector<double>(), 1e-5), ConfigurationError);
		REQUIRE_THROWS_AS(ch.LoadList({1}, 0), ConfigurationError);
		REQUIRE_THROWS_AS(ch.LoadList({1}, 1e-5, 0), ConfigurationError);
		REQUIRE_THROWS_AS(ch.LoadList({1}, 1e-5, -2), ConfigurationError);
		REQUIRE_THROWS_AS(ch.LoadList({11}, 1e-5), ConfigurationError);
		REQUIRE_THROWS_AS(ch.LoadList({1}, 1e-5, 1, false, false, -1), ConfigurationError);
		REQUIRE(Commands().empty());
	}
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2Channel_Triggering")
{
	auto& ch = m_qdac->GetQDAC2Channel(3);
	auto trigger = m_qdac->AllocateTrigger();

	ch.StartOn(trigger);
	REQUIRE(Commands() == vector<string>{
		"sour3:dc:trig:sour int1",
		"sour3:dc:init:cont on"
		});

	ch.StartOnExternal(3);
	REQUIRE(Commands() == vector<string>{
		"sour3:dc:trig:sour ext3",
		"sour3:dc:init:cont on"
		});

	ch.StartImmediate();
	REQUIRE(Commands() == vector<string>{
		"sour3:dc:init:cont off",
		"sour3:dc:trig:sour imm",
		"sour3:dc:init"
		});

	ch.Abort();
	REQUIRE(Commands() == vector<string>{
		"sour3:dc:abor",
		"sour3:dc:trig:sour imm"
		});

	ch.SetStepStartMarker(2);
	REQUIRE(Commands() == vector<string>{"sour3:dc:mark:sst 2"});

	REQUIRE_THROWS_AS(ch.StartOnExternal(5), InvalidValueError);
	trigger.Release();
	REQUIRE_THROWS_AS(ch.StartOn(trigger), InvalidValueError);
	REQUIRE(Commands().empty());
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2Channel_SineMarker")
{
	auto& ch = m_qdac->GetQDAC2Channel(1);
	auto trigger = m_qdac->AllocateTrigger();

	ch.ConfigureSineMarkerWave(5e-5, 3);
	ch.SineStartOn(trigger);
	ch.SetSinePeriodStartMarker(4);
	REQUIRE(Commands() == vector<string>{
		"sour1:sine:trig:sour hold",
		"sour1:sine:per 5e-05",
		"sour1:sine:pol norm",
		"sour1:sine:span 0",
		"sour1:sine:offs 0",
		"sour1:sine:slew inf",
		"sour1:sine:del 0",
		"sour1:sine:coun 3",
		"sour1:sine:trig:sour bus",
		"sour1:sine:init:cont on",
		"sour1:sine:trig:sour int1",
		"sour1:sine:init:cont on",
		"sour1:sine:mark:pstart 4"
		});

	ch.AbortSine();
	REQUIRE(Commands() == vector<string>{
		"sour1:sine:abor",
		"sour1:sine:mark:pstart 0",
		"sour1:sine:trig:sour imm"
		});

	REQUIRE_THROWS_AS(ch.ConfigureSineMarkerWave(0, 3), ConfigurationError);
	REQUIRE_THROWS_AS(ch.ConfigureSineMarkerWave(1e-3, 0), ConfigurationError);
	REQUIRE(Commands().empty());
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2Channel_Queries")
{
	m_transport->SetResponder([](const string& query) -> string
		{
			if(query == "sour2:list:poin?")
				return "3";
			if(query == "sour2:list:ncl?")
				return "2\n";
			if(query == "sour2:list:volt?")
				return "-1,0,1";
			if(query == "sens2:data:last?")
				return "1.5e-09";
			return "0";
		});

	auto& ch = m_qdac->GetQDAC2Channel(2);
	REQUIRE(ch.GetListPoints() == 3);
	REQUIRE(ch.GetListCyclesRemaining() == 2);
	REQUIRE(ch.GetListValues() == vector<double>{-1, 0, 1});
	REQUIRE(ch.GetCurrent() == Approx(1.5e-9));

	REQUIRE(Commands() == vector<string>{
		"sour2:list:poin?",
		"sour2:list:ncl?",
		"sour2:list:volt?",
		"sens2:data:last?"
		});
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2Channel_CurrentSensing")
{
	auto& ch = m_qdac->GetQDAC2Channel(5);
	ch.SetCurrentRange("high");
	ch.SetCurrentNplc(10);
	REQUIRE(Commands() == vector<string>{
		"sens5:rang high",
		"sens5:nplc 10"
		});

	REQUIRE_THROWS_AS(ch.SetCurrentRange("medium"), InvalidValueError);
	REQUIRE_THROWS_AS(ch.SetCurrentNplc(0), InvalidValueError);
	REQUIRE(Commands().empty());
}
