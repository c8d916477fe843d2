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
	@brief Tests of QDAC2 instrument wide functionality
 */

#include <catch2/catch.hpp>

#include "TestHelpers.h"

using namespace std;

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2_Identity")
{
	REQUIRE(m_qdac->GetVendor() == "QDevil");
	REQUIRE(m_qdac->GetName() == "QDAC-II");
	REQUIRE(m_qdac->GetSerial() == "00000");
	REQUIRE(m_qdac->GetFirmwareVersion() == "0.0.0");
	REQUIRE(m_qdac->GetDriverName() == "qdevil_qdac2");
	REQUIRE(m_qdac->GetTransportName() == "null");
	REQUIRE(m_qdac->m_nickname == "qdac");
	REQUIRE(m_qdac->GetTransport() == m_transport);
	REQUIRE(m_qdac->GetTriggerPool().GetSize() == 16);
	REQUIRE(m_qdac->GetFreeTriggerCount() == 16);

	REQUIRE(m_qdac->GetChannelCount() == QDAC2::CHANNELS);
	REQUIRE(m_qdac->GetQDAC2Channel(24).GetNumber() == 24);
	REQUIRE(m_qdac->GetQDAC2Channel(1).GetHwname() == "ch1");
	REQUIRE(m_qdac->GetQDAC2Channel(1).GetQDAC() == m_qdac.get());
	REQUIRE(m_qdac->GetChannelByHwName("ch3") == &m_qdac->GetQDAC2Channel(3));
	REQUIRE(m_qdac->GetChannelByHwName("ch99") == nullptr);
	REQUIRE(m_qdac->GetChannel(1)->GetIndex() == 1);
	REQUIRE(m_qdac->GetChannel(1)->GetInstrument() == m_qdac.get());
	REQUIRE(m_qdac->GetChannel(24) == nullptr);
	REQUIRE_THROWS_AS(m_qdac->GetQDAC2Channel(0), InvalidValueError);
	REQUIRE_THROWS_AS(m_qdac->GetQDAC2Channel(25), InvalidValueError);

	//Identification happens before recording starts
	REQUIRE(Commands().empty());
}

TEST_CASE("QDAC2_BadIdentification")
{
	auto transport = new SCPINullTransport("");
	transport->SetResponder([](const string&) -> string { return "nonsense"; });

	//The instrument owns the transport, even when construction fails
	REQUIRE_THROWS_AS(QDAC2(transport, "bad"), TransportError);
}

TEST_CASE("QDAC2_TransportDescription")
{
	QDAC2 qdac(new SCPINullTransport("sim"), "sim");
	REQUIRE(qdac.GetTransportName() == "null");
	REQUIRE(qdac.GetTransportConnectionString() == "sim");
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2_ExternalTriggers")
{
	REQUIRE(m_qdac->GetFreeTriggerCount() == 16);

	auto trigger = m_qdac->AllocateTrigger();
	REQUIRE(trigger.GetValue() == 1);
	REQUIRE(m_qdac->GetFreeTriggerCount() == 15);

	m_qdac->ConnectExternalTrigger(2, trigger);
	m_qdac->ConnectExternalTrigger(5, trigger, 1e-3);
	m_qdac->FireTrigger(trigger);
	m_qdac->DisconnectExternalTrigger(2);
	REQUIRE(Commands() == vector<string>{
		"outp:trig2:sour int1",
		"outp:trig2:widt 1e-06",
		"outp:trig5:sour int1",
		"outp:trig5:widt 0.001",
		"tint 1",
		"outp:trig2:sour hold"
		});

	REQUIRE_THROWS_AS(m_qdac->ConnectExternalTrigger(6, trigger), InvalidValueError);
	REQUIRE_THROWS_AS(m_qdac->DisconnectExternalTrigger(0), InvalidValueError);

	trigger.Release();
	REQUIRE_THROWS_AS(m_qdac->FireTrigger(trigger), InvalidValueError);
	REQUIRE_THROWS_AS(m_qdac->ConnectExternalTrigger(1, trigger), InvalidValueError);
	REQUIRE(Commands().empty());
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2_InstrumentCommands")
{
	m_qdac->StartAll();
	m_qdac->AbortAll();
	REQUIRE(m_qdac->GetErrors() == "0,\"No error\"");
	REQUIRE(m_qdac->GetNextError() == "0,\"No error\"");
	REQUIRE(m_qdac->GetErrorCount() == 0);
	REQUIRE(Commands() == vector<string>{
		"*trg",
		"abor",
		"syst:err:all?",
		"syst:err?",
		"syst:err:coun?"
		});

	m_qdac->StopRecordingSCPI();
	m_qdac->AbortAll();
	REQUIRE(Commands().empty());
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2_ResetFreesTriggers")
{
	auto a = m_qdac->AllocateTrigger();
	auto b = m_qdac->AllocateTrigger();
	REQUIRE(m_qdac->GetFreeTriggerCount() == 14);

	m_qdac->Reset();
	REQUIRE(Commands() == vector<string>{"*rst"});
	REQUIRE(m_qdac->GetFreeTriggerCount() == 16);

	auto c = m_qdac->AllocateTrigger();
	REQUIRE(c.GetValue() == 1);

	//Leases from before the reset cannot drive a number that now belongs to "c"
	REQUIRE_FALSE(a.IsValid());
	REQUIRE(c.IsValid());
	REQUIRE_THROWS_AS(m_qdac->FireTrigger(a), InvalidValueError);
	REQUIRE_THROWS_AS(m_qdac->ConnectExternalTrigger(4, a), InvalidValueError);
	REQUIRE_THROWS_AS(m_qdac->GetQDAC2Channel(1).StartOn(a), InvalidValueError);
	REQUIRE_THROWS_AS(m_qdac->GetQDAC2Channel(1).SineStartOn(b), InvalidValueError);
	REQUIRE(Commands().empty());

	//Stale leases do not hand back numbers that were reissued
	a.Release();
	b.Release();
	REQUIRE(m_qdac->GetFreeTriggerCount() == 15);
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2_Settings")
{
	REQUIRE(m_qdac->GetLineFrequency() == 50);
	m_qdac->SetLineFrequency(60);
	REQUIRE(m_qdac->GetLineFrequency() == 60);
	REQUIRE_THROWS_AS(m_qdac->SetLineFrequency(0), InvalidValueError);
	REQUIRE(m_qdac->GetLineFrequency() == 60);

	REQUIRE(m_qdac->GetRoundOff() == -1);
	REQUIRE(m_qdac->RoundVoltage(0.123456) == 0.123456);
	m_qdac->SetRoundOff(3);
	REQUIRE(m_qdac->RoundVoltage(0.123456) == Approx(0.123));
	REQUIRE(m_qdac->RoundVoltage(-0.0006) == Approx(-0.001));
	REQUIRE_THROWS_AS(m_qdac->SetRoundOff(-2), InvalidValueError);
}

TEST_CASE_METHOD(QDAC2Fixture, "QDAC2_Configuration")
{
	m_qdac->SetLineFrequency(60);
	m_qdac->SetRoundOff(4);

	auto node = m_qdac->SerializeConfiguration();
	REQUIRE(node["nick"].as<string>() == "qdac");
	REQUIRE(node["vendor"].as<string>() == "QDevil");
	REQUIRE(node["driver"].as<string>() == "qdevil_qdac2");
	REQUIRE(node["transport"].as<string>() == "null");
	REQUIRE(node["line_frequency_hz"].as<double>() == 60);
	REQUIRE(node["round_off"].as<int>() == 4);

	QDAC2Fixture other("other");
	other.m_qdac->LoadConfiguration(node);
	REQUIRE(other.m_qdac->m_nickname == "qdac");
	REQUIRE(other.m_qdac->GetLineFrequency() == 60);
	REQUIRE(other.m_qdac->GetRoundOff() == 4);

	REQUIRE_THROWS_AS(other.m_qdac->LoadConfiguration(YAML::Load("{line_frequency_hz: fast}")), ConfigurationError);
	REQUIRE_THROWS_AS(other.m_qdac->LoadConfiguration(YAML::Load("{line_frequency_hz: -50}")), InvalidValueError);
}
