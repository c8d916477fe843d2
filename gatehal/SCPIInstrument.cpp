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
	@brief Implementation of SCPIInstrument
 */

#include "gatehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates the instrument and takes ownership of the transport

	@param transport	Transport to talk over
	@param identify		If true, query *IDN? and fill in vendor, model, serial and firmware version
 */
SCPIInstrument::SCPIInstrument(SCPITransport* transport, bool identify)
	: m_transport(transport)
	, m_recording(false)
	, m_sleeper(sigc::ptr_fun(&SCPIInstrument::DefaultSleep))
{
	if(m_transport == nullptr)
		throw InvalidValueError("SCPIInstrument needs a transport");

	if(identify)
	{
		try
		{
			Identify();
		}
		catch(const GatehalError&)
		{
			delete m_transport;
			m_transport = nullptr;
			throw;
		}
	}

	m_serializers.push_back(sigc::mem_fun(*this, &SCPIInstrument::DoSerializeConfiguration));
}

/**
	@brief Asks for the ID and fills in vendor, model, serial and firmware version
 */
void SCPIInstrument::Identify()
{
	auto reply = Trim(m_transport->SendCommandImmediateWithReply("*IDN?"));
	auto fields = explode(reply, ',');
	if(fields.size() != 4)
	{
		LogError("Bad IDN response \"%s\"\n", reply.c_str());
		throw TransportError("Bad IDN response \"" + reply + "\"");
	}

	m_vendor = Trim(fields[0]);
	m_model = Trim(fields[1]);
	m_serial = Trim(fields[2]);
	m_fwVersion = Trim(fields[3]);

	LogDebug("Connected to %s %s (serial %s, firmware %s)\n",
		m_vendor.c_str(), m_model.c_str(), m_serial.c_str(), m_fwVersion.c_str());
}

SCPIInstrument::~SCPIInstrument()
{
	delete m_transport;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Device information

string SCPIInstrument::GetTransportConnectionString()
{
	return m_transport->GetConnectionString();
}

string SCPIInstrument::GetTransportName()
{
	return m_transport->GetName();
}

string SCPIInstrument::GetName() const
{
	return m_model;
}

string SCPIInstrument::GetVendor() const
{
	return m_vendor;
}

string SCPIInstrument::GetSerial() const
{
	return m_serial;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Command API

/**
	@brief Renders a request and sends it
 */
void SCPIInstrument::SendRequest(const SCPIRequest& req)
{
	SendCommand(req.Render());
}

/**
	@brief Renders a request, sends it and returns the reply
 */
string SCPIInstrument::QueryRequest(const SCPIRequest& req)
{
	return Query(req.Render());
}

/**
	@brief Sends a query and parses the reply as a number

	@throw TransportError if the reply is not a number
 */
double SCPIInstrument::QueryNumber(const SCPIRequest& req)
{
	auto reply = QueryRequest(req);
	auto values = ParseValueList(reply);
	if(values.size() != 1)
		throw TransportError("Expected one number in reply to \"" + req.Render() + "\", got \"" + reply + "\"");
	return values[0];
}

void SCPIInstrument::SendCommand(const string& cmd)
{
	if(m_recording)
		m_recordedCommands.push_back(cmd);

	m_transport->SendCommandImmediate(cmd);
}

string SCPIInstrument::Query(const string& cmd)
{
	if(m_recording)
		m_recordedCommands.push_back(cmd);

	return Trim(m_transport->SendCommandImmediateWithReply(cmd));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Command recording

/**
	@brief Clears the recording buffer and starts recording every command and query sent
 */
void SCPIInstrument::StartRecordingSCPI()
{
	m_recordedCommands.clear();
	m_recording = true;
}

void SCPIInstrument::StopRecordingSCPI()
{
	m_recording = false;
}

/**
	@brief Returns the commands recorded so far and empties the buffer. Recording continues.
 */
vector<string> SCPIInstrument::GetRecordedSCPICommands()
{
	vector<string> ret;
	ret.swap(m_recordedCommands);
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Blocking waits

void SCPIInstrument::Sleep(double seconds)
{
	LogTrace("Waiting %s\n", Unit(Unit::UNIT_SECONDS).PrettyPrint(seconds).c_str());
	m_sleeper(seconds);
}

void SCPIInstrument::DefaultSleep(double seconds)
{
	this_thread::sleep_for(chrono::duration<double>(seconds));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

void SCPIInstrument::DoSerializeConfiguration(YAML::Node& node)
{
	node["transport"] = GetTransportName();
	node["args"] = GetTransportConnectionString();
	node["driver"] = GetDriverName();
}
