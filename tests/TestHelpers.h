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
	@brief Simulated instruments shared by the test cases
 */

#ifndef TestHelpers_h
#define TestHelpers_h

#include "gatehal.h"

/**
	@brief Null transport that refuses to send commands starting with a given prefix
 */
class FailingTransport : public SCPINullTransport
{
public:
	FailingTransport()
		: SCPINullTransport("failing")
	{}

	virtual bool SendCommand(const std::string& cmd) override
	{
		if(!m_failOn.empty() && (cmd.find(m_failOn) == 0))
			return false;
		return SCPINullTransport::SendCommand(cmd);
	}

	///@brief Prefix of the commands to fail, empty to send everything
	std::string m_failOn;
};

/**
	@brief A QDAC-II on a null transport, recording every command and never sleeping
 */
class QDAC2Fixture
{
public:
	QDAC2Fixture(const std::string& nickname = "qdac", SCPINullTransport* transport = nullptr);
	virtual ~QDAC2Fixture();

	///@brief Returns the commands sent since the last call
	std::vector<std::string> Commands()
	{ return m_qdac->GetRecordedSCPICommands(); }

	void RecordSleep(double seconds)
	{ m_sleeps.push_back(seconds); }

	//Owned by m_qdac
	SCPINullTransport* m_transport;
	std::unique_ptr<QDAC2> m_qdac;

	std::vector<double> m_sleeps;
};

std::vector<std::string> Concat(const std::vector<std::string>& a, const std::vector<std::string>& b);

std::vector<std::string> ListCommands(
	int channel,
	const std::string& values,
	const std::string& dwell,
	int count,
	const std::string& triggerSource);

#endif
