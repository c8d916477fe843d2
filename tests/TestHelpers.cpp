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
	@brief Implementation of QDAC2Fixture
 */

#include "TestHelpers.h"

using namespace std;

QDAC2Fixture::QDAC2Fixture(const string& nickname, SCPINullTransport* transport)
	: m_transport(transport ? transport : new SCPINullTransport(""))
	, m_qdac(new QDAC2(m_transport, nickname))
{
	m_qdac->SetSleeper(sigc::mem_fun(*this, &QDAC2Fixture::RecordSleep));
	m_qdac->StartRecordingSCPI();
}

QDAC2Fixture::~QDAC2Fixture()
{
}

vector<string> Concat(const vector<string>& a, const vector<string>& b)
{
	vector<string> ret = a;
	ret.insert(ret.end(), b.begin(), b.end());
	return ret;
}

/**
	@brief Commands for uploading a list to a channel and binding it to a trigger source ("int1", "ext3")
 */
vector<string> ListCommands(
	int channel,
	const string& values,
	const string& dwell,
	int count,
	const string& triggerSource)
{
	string sour = "sour" + to_string(channel) + ":";
	return vector<string>{
		sour + "dc:trig:sour hold",
		sour + "volt:mode list",
		sour + "list:volt " + values,
		sour + "list:tmod auto",
		sour + "list:dwel " + dwell,
		sour + "dc:del 0",
		sour + "list:dir up",
		sour + "list:coun " + to_string(count),
		sour + "dc:trig:sour bus",
		sour + "dc:init:cont on",
		sour + "dc:trig:sour " + triggerSource,
		sour + "dc:init:cont on"
		};
}
