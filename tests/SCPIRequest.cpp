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
	@brief Tests of SCPI request rendering and the number formatting helpers
 */

#include <catch2/catch.hpp>

#include "TestHelpers.h"

using namespace std;

TEST_CASE("Format_Numbers")
{
	REQUIRE(to_string_scpi(0) == "0");
	REQUIRE(to_string_scpi(-0.0) == "0");
	REQUIRE(to_string_scpi(0.5) == "0.5");
	REQUIRE(to_string_scpi(-1) == "-1");
	REQUIRE(to_string_scpi(1e-6) == "1e-06");
	REQUIRE(to_string_scpi(numeric_limits<double>::infinity()) == "inf");
	REQUIRE(to_string_scpi(0.1 + 0.2) == "0.3");

	REQUIRE(FormatValueList(vector<double>{-1, 0, 1}) == "-1,0,1");
	REQUIRE(FormatValueList(vector<double>()) == "");
	REQUIRE(FormatChannelList(vector<int>{1, 2, 3}) == "(@1,2,3)");
}

TEST_CASE("SCPIRequest_Render")
{
	REQUIRE(SCPIRequest("sour", 3, "list:volt").NumberList({-1, 0, 1}).Render() == "sour3:list:volt -1,0,1");
	REQUIRE(SCPIRequest("outp:trig", 4, "sour").Keyword("int2").Render() == "outp:trig4:sour int2");
	REQUIRE(SCPIRequest::Query("read").ChannelList({1, 2, 3}).Render() == "read? (@1,2,3)");
	REQUIRE(SCPIRequest("sens", 0, "rang").Keyword("low").ChannelList({1, 2}).Render() == "sens:rang low,(@1,2)");
	REQUIRE(SCPIRequest("tint").Integer(5).Render() == "tint 5");
	REQUIRE(SCPIRequest::Query("*IDN").Render() == "*IDN?");
	REQUIRE(SCPIRequest::Query("sour", 7, "list:poin").Render() == "sour7:list:poin?");
	REQUIRE(SCPIRequest("abor").Render() == "abor");
}

TEST_CASE("SCPIRequest_Arguments")
{
	auto req = SCPIRequest("sour", 2, "volt").Number(0.25);
	REQUIRE(req.GetSubsystem() == "sour");
	REQUIRE(req.GetChannel() == 2);
	REQUIRE(req.GetVerb() == "volt");
	REQUIRE_FALSE(req.IsQuery());
	REQUIRE(req.GetArguments().size() == 1);
	REQUIRE(req.GetArguments()[0].GetType() == SCPIArgument::ARG_NUMBER);
	REQUIRE(req.GetArguments()[0].GetNumber() == 0.25);

	auto sense = SCPIRequest("sens", 0, "rang").Keyword("low").ChannelList({3, 1});
	REQUIRE(sense.GetArguments().size() == 2);
	REQUIRE(sense.GetArguments()[0].GetKeyword() == "low");
	REQUIRE(sense.GetArguments()[1].GetType() == SCPIArgument::ARG_CHANNEL_LIST);
	REQUIRE(sense.GetArguments()[1].GetChannels() == vector<int>{3, 1});

	auto list = SCPIRequest("sour", 1, "list:volt").NumberList({0.1, -0.2});
	REQUIRE(list.GetArguments()[0].GetNumbers() == vector<double>{0.1, -0.2});
	REQUIRE(SCPIRequest("tint").Integer(5).GetArguments()[0].GetInteger() == 5);
}

TEST_CASE("ParseValueList")
{
	REQUIRE(ParseValueList("0.1,0.2, 0.3\n") == vector<double>{0.1, 0.2, 0.3});
	REQUIRE(ParseValueList("-1e-06") == vector<double>{-1e-6});
	REQUIRE(ParseValueList("").empty());

	REQUIRE_THROWS_AS(ParseValueList("garbage"), TransportError);
	REQUIRE_THROWS_AS(ParseValueList("1,2x,3"), TransportError);
}

TEST_CASE("Unit_PrettyPrint")
{
	REQUIRE(Unit(Unit::UNIT_VOLTS).PrettyPrint(2.5) == "2.5 V");
	REQUIRE(Unit(Unit::UNIT_VOLTS).PrettyPrint(0.5) == "500 mV");
	REQUIRE(Unit("A") == Unit(Unit::UNIT_AMPS));
	REQUIRE(Unit(Unit::UNIT_SIEMENS).ToString() == "S");
}
