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
	@brief Tests of virtual sweeps on a single instrument
 */

#include <catch2/catch.hpp>

#include "TestHelpers.h"

using namespace std;

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_2D")
{
	auto arrangement = m_qdac->Arrange({{"plunger1", 1}, {"plunger2", 2}, {"plunger3", 3}});
	arrangement->SetVirtualVoltage("plunger3", 0.1);
	Commands();

	auto sweep = arrangement->VirtualSweep2D("plunger1", {0.1, 0.2}, "plunger2", {-0.1, 0.3}, 2e-6);
	sweep->Start();

	auto expected = ListCommands(1, "0.1,0.2,0.1,0.2", "2e-06", 1, "int1");
	expected = Concat(expected, ListCommands(2, "-0.1,-0.1,0.3,0.3", "2e-06", 1, "int1"));
	expected = Concat(expected, ListCommands(3, "0.1,0.1,0.1,0.1", "2e-06", 1, "int1"));
	expected.push_back("tint 1");
	REQUIRE(Commands() == expected);

	REQUIRE(sweep->GetContactNames() == vector<string>{"plunger1", "plunger2", "plunger3"});
	REQUIRE(sweep->GetPointCount() == 4);
	REQUIRE(sweep->GetActualValues("plunger2") == vector<double>{-0.1, -0.1, 0.3, 0.3});
	REQUIRE_THROWS_AS(sweep->GetActualValues("sensor"), UnknownContactError);
	REQUIRE(sweep->GetStartTriggerValue() == 1);
	REQUIRE(sweep->GetLastConfiguredInstrument() == "qdac");

	//Sweeping leaves the virtual voltages alone
	REQUIRE(arrangement->GetVirtualVoltages() == vector<double>{0, 0, 0.1});
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_Detune")
{
	auto arrangement = m_qdac->Arrange({{"plunger1", 1}, {"plunger2", 2}});

	auto sweep = arrangement->VirtualDetune({"plunger1", "plunger2"}, {-0.3, 0.6}, {0.3, -0.1}, 5, 5e-6, "", "", 2);

	auto expected = Concat(
		ListCommands(1, "-0.3,-0.15,0,0.15,0.3,0.15,0,-0.15", "5e-06", 2, "int1"),
		ListCommands(2, "0.6,0.425,0.25,0.075,-0.1,0.075,0.25,0.425", "5e-06", 2, "int1"));
	REQUIRE(Commands() == expected);
	REQUIRE(sweep->GetPointCount() == 8);

	REQUIRE_THROWS_AS(
		arrangement->VirtualDetune({"plunger1", "plunger2"}, {-0.3}, {0.3, -0.1}, 5),
		InvalidValueError);
	REQUIRE_THROWS_AS(
		arrangement->VirtualDetune({"plunger1", "sensor"}, {-0.3, 0}, {0.3, 0}, 5),
		UnknownContactError);
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_1DWithStepTrigger")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 5}, {"gate2", 6}}, {{"dmm", 2}}, {"go"});
	Commands();

	auto sweep = arrangement->VirtualSweep1D("gate2", {-1, 0, 1}, 1e-5, "go", "dmm", -1);
	sweep->Start();

	auto expected = vector<string>{"sour5:dc:mark:sst 2"};
	expected = Concat(expected, ListCommands(5, "0,0,0", "1e-05", -1, "int1"));
	expected = Concat(expected, ListCommands(6, "-1,0,1", "1e-05", -1, "int1"));
	expected.push_back("tint 1");
	REQUIRE(Commands() == expected);

	//A borrowed start trigger stays with the arrangement
	REQUIRE(m_qdac->GetFreeTriggerCount() == 14);
	sweep->Close();
	REQUIRE(Commands() == vector<string>{
		"sour5:dc:mark:sst 0",
		"sour5:dc:abor",
		"sour5:dc:trig:sour imm",
		"sour6:dc:abor",
		"sour6:dc:trig:sour imm"
		});
	REQUIRE(m_qdac->GetFreeTriggerCount() == 14);
	REQUIRE(arrangement->GetTriggerByName("go").IsValid());

	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("gate2", {0}, 1e-5, "stop"), UnknownTriggerError);
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_OuterStepTrigger")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 2}, {"gate2", 3}}, {{"slow", 1}}, {}, 1);
	REQUIRE(Commands() == vector<string>{
		"outp:trig1:sour int1",
		"outp:trig1:widt 1e-06"
		});

	auto sweep = arrangement->VirtualSweep2D("gate1", {0, 0.5}, "gate2", {0, 1, 2}, 2.5e-5, "slow");

	auto expected = Concat(
		ListCommands(2, "0,0.5,0,0.5,0,0.5", "2.5e-05", 1, "int2"),
		ListCommands(3, "0,0,1,1,2,2", "2.5e-05", 1, "int2"));
	expected = Concat(expected, vector<string>{
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
		"sour1:sine:trig:sour int2",
		"sour1:sine:init:cont on",
		"sour1:sine:mark:pstart 1"
		});
	REQUIRE(Commands() == expected);
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_OuterStepTriggerNeedsChannel")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 1}, {"gate2", 2}}, {{"slow", 1}});
	Commands();

	REQUIRE_THROWS_AS(
		arrangement->VirtualSweep2D("gate1", {0, 0.5}, "gate2", {0, 1}, 1e-5, "slow"),
		ConfigurationError);
	REQUIRE_THROWS_AS(
		arrangement->VirtualSweep2D("gate1", {0, 0.5}, "gate1", {0, 1}),
		InvalidValueError);
	REQUIRE(Commands().empty());
	REQUIRE(m_qdac->GetFreeTriggerCount() == 15);
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_TriggersFromBeforeResetAreRejected")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 2}, {"gate2", 3}}, {{"slow", 1}}, {"mark"}, 1);
	m_qdac->Reset();
	Commands();

	REQUIRE_THROWS_WITH(
		arrangement->VirtualSweep1D("gate1", {0, 1}, 1e-5, "", "mark"),
		"Step trigger has already been released");
	REQUIRE_THROWS_WITH(
		arrangement->VirtualSweep2D("gate1", {0, 0.5}, "gate2", {0, 1}, 1e-5, "slow"),
		"Outer step trigger has already been released");
	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("gate1", {0, 1}, 1e-5, "mark"), ConfigurationError);

	REQUIRE(Commands().empty());
	REQUIRE(m_qdac->GetFreeTriggerCount() == 16);
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_CleanupOrder")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 1}, {"gate2", 2}}, {{"dmm", 4}, {"vna", 5}}, {"wave"}, 3);
	REQUIRE(arrangement->GetTriggerByName("wave").GetValue() == 1);
	REQUIRE(arrangement->GetTriggerByName("dmm").GetValue() == 2);
	REQUIRE(arrangement->GetTriggerByName("vna").GetValue() == 3);

	auto sweep = arrangement->VirtualSweep2D(
		"gate1", SweepGenerator::Linspace(-0.2, 0.6, 5),
		"gate2", SweepGenerator::Linspace(-0.7, 0.15, 5),
		1e-5, "vna", "dmm");
	REQUIRE(sweep->GetStartTriggerValue() == 4);
	REQUIRE(m_qdac->GetFreeTriggerCount() == 12);
	Commands();

	sweep->Close();
	REQUIRE(Commands() == vector<string>{
		"sour1:dc:mark:sst 0",
		"sour1:dc:abor",
		"sour1:dc:trig:sour imm",
		"sour2:dc:abor",
		"sour2:dc:trig:sour imm",
		"sour3:sine:abor",
		"sour3:sine:mark:pstart 0",
		"sour3:sine:trig:sour imm"
		});
	REQUIRE(m_qdac->GetFreeTriggerCount() == 13);

	REQUIRE(sweep->IsClosed());
	REQUIRE_THROWS_AS(sweep->Start(), InvalidValueError);
	sweep->Close();
	REQUIRE(Commands().empty());

	arrangement->Close();
	REQUIRE(Commands() == vector<string>{
		"outp:trig4:sour hold",
		"outp:trig5:sour hold"
		});
	REQUIRE(m_qdac->GetFreeTriggerCount() == 16);

	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("gate1", {0}), InvalidValueError);
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_DestructorCleansUp")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 1}});
	{
		auto sweep = arrangement->VirtualSweep1D("gate1", {0, 1});
		REQUIRE(m_qdac->GetFreeTriggerCount() == 15);
		Commands();
	}
	REQUIRE(Commands() == vector<string>{
		"sour1:dc:abor",
		"sour1:dc:trig:sour imm"
		});
	REQUIRE(m_qdac->GetFreeTriggerCount() == 16);
}

TEST_CASE_METHOD(QDAC2Fixture, "VirtualSweep_InvalidSetupSendsNothing")
{
	auto arrangement = m_qdac->Arrange({{"gate1", 1}, {"gate2", 2}});
	arrangement->InitiateCorrection("gate2", {4, 1});
	Commands();

	//gate2 would have to go to 12 V
	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("gate1", {0, 3}), ConfigurationError);
	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("gate1", {0, 1}, 0), ConfigurationError);
	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("gate1", {0, 1}, 1e-5, "", "", 0), ConfigurationError);
	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("sensor", {0, 1}), UnknownContactError);

	REQUIRE(Commands().empty());
	REQUIRE(m_qdac->GetFreeTriggerCount() == 16);
}

TEST_CASE("VirtualSweep_FailureIsNotRolledBack")
{
	auto transport = new FailingTransport;
	QDAC2Fixture fixture("qdac", transport);
	auto arrangement = fixture.m_qdac->Arrange({{"gate1", 1}, {"gate2", 2}});
	fixture.Commands();

	transport->m_failOn = "sour2:list:volt";
	REQUIRE_THROWS_AS(arrangement->VirtualSweep1D("gate1", {0, 1}), TransportError);

	//Channel 1 stays armed, but the sweep's own trigger went back to the pool
	auto commands = fixture.Commands();
	REQUIRE(commands.size() == 15);
	REQUIRE(commands[0] == "sour1:dc:trig:sour hold");
	REQUIRE(commands[14] == "sour2:list:volt 0,0");
	REQUIRE(fixture.m_qdac->GetFreeTriggerCount() == 16);
}
