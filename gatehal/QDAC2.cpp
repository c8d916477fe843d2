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
	@brief Implementation of QDAC2
 */

#include "gatehal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

QDAC2::QDAC2(SCPITransport* transport, const string& nickname, bool identify)
	: SCPIInstrument(transport, identify)
	, m_triggers(INTERNAL_TRIGGERS)
	, m_lineFrequency(50)
	, m_roundOff(-1)
{
	m_nickname = nickname;

	for(int i=1; i<=CHANNELS; i++)
		m_channels.push_back(new QDAC2Channel(this, i));

	m_serializers.push_back(sigc::mem_fun(*this, &QDAC2::DoSerializeConfiguration));
	m_loaders.push_back(sigc::mem_fun(*this, &QDAC2::DoLoadConfiguration));

	LogVerbose("QDAC2 \"%s\": %d channels, %d internal triggers\n", m_nickname.c_str(), CHANNELS, INTERNAL_TRIGGERS);
}

QDAC2::~QDAC2()
{
}

/**
	@brief Gets a channel by its 1-based number

	@throw InvalidValueError if there is no such channel
 */
QDAC2Channel& QDAC2::GetQDAC2Channel(int number) const
{
	if( (number < 1) || (number > CHANNELS) )
		throw InvalidValueError("Channel " + to_string(number) + " does not exist on " + m_nickname);

	return *dynamic_cast<QDAC2Channel*>(m_channels[number - 1]);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Triggers

/**
	@brief Leases an internal trigger from this instrument's pool

	@throw ResourceExhaustedError if all triggers are in use
 */
InternalTrigger QDAC2::AllocateTrigger()
{
	return m_triggers.Allocate();
}

/**
	@brief Marks every internal trigger as free, invalidating all outstanding leases
 */
void QDAC2::FreeAllTriggers()
{
	m_triggers.Reset();
}

/**
	@throw InvalidValueError if the port is not an external trigger output
 */
void QDAC2::CheckExternalOutput(int port)
{
	if( (port < 1) || (port > EXTERNAL_OUTPUTS) )
		throw InvalidValueError("External output trigger " + to_string(port) + " does not exist");
}

/**
	@brief Routes an internal trigger to an external trigger output

	@param port		External output (1-5)
	@param trigger	Internal trigger to route
	@param width_s	Output pulse width
 */
void QDAC2::ConnectExternalTrigger(int port, const InternalTrigger& trigger, double width_s)
{
	CheckExternalOutput(port);
	if(!trigger.IsValid())
		throw InvalidValueError("Cannot route a released trigger to external output " + to_string(port));

	LogTrace("%s: ext out %d <- int%d\n", m_nickname.c_str(), port, trigger.GetValue());

	SendRequest(SCPIRequest("outp:trig", port, "sour").Keyword("int" + to_string(trigger.GetValue())));
	SendRequest(SCPIRequest("outp:trig", port, "widt").Number(width_s));
}

/**
	@brief Stops an external trigger output from following any internal trigger
 */
void QDAC2::DisconnectExternalTrigger(int port)
{
	CheckExternalOutput(port);
	SendRequest(SCPIRequest("outp:trig", port, "sour").Keyword("hold"));
}

/**
	@brief Fires an internal trigger
 */
void QDAC2::FireTrigger(const InternalTrigger& trigger)
{
	if(!trigger.IsValid())
		throw InvalidValueError("Cannot fire a released trigger");

	SendRequest(SCPIRequest("tint").Integer(trigger.GetValue()));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Instrument wide commands

/**
	@brief Triggers every generator that waits for a bus trigger
 */
void QDAC2::StartAll()
{
	SendRequest(SCPIRequest("*trg"));
}

/**
	@brief Aborts every generator on the instrument
 */
void QDAC2::AbortAll()
{
	SendRequest(SCPIRequest("abor"));
}

/**
	@brief Resets the instrument to power-on state and frees all internal triggers
 */
void QDAC2::Reset()
{
	SendRequest(SCPIRequest("*rst"));
	FreeAllTriggers();
}

/**
	@brief Reads and clears the whole error queue
 */
string QDAC2::GetErrors()
{
	return QueryRequest(SCPIRequest::Query("syst:err:all"));
}

/**
	@brief Reads and removes the oldest entry of the error queue
 */
string QDAC2::GetNextError()
{
	return QueryRequest(SCPIRequest::Query("syst:err"));
}

int QDAC2::GetErrorCount()
{
	return static_cast<int>(QueryNumber(SCPIRequest::Query("syst:err:coun")));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Settings

void QDAC2::SetLineFrequency(double hz)
{
	if(!(hz > 0))
		throw InvalidValueError("Line frequency must be positive, got " + to_string_scpi(hz));
	m_lineFrequency = hz;
}

void QDAC2::SetRoundOff(int decimals)
{
	if(decimals < -1)
		throw InvalidValueError("Round-off must be a number of decimals or -1, got " + to_string(decimals));
	m_roundOff = decimals;
}

/**
	@brief Applies the configured round-off to a computed voltage
 */
double QDAC2::RoundVoltage(double volts) const
{
	if(m_roundOff < 0)
		return volts;

	double scale = pow(10, m_roundOff);
	return round(volts * scale) / scale;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Arrangements

/**
	@brief Creates a virtual gate arrangement on this instrument

	@param contacts				Contact names and their channel numbers, in contact order
	@param outputTriggers		Trigger names to route to external outputs
	@param internalTriggers		Names of internal triggers to allocate
	@param outerTriggerChannel	Channel used to mark outer steps in 2D sweeps, 0 for none
 */
unique_ptr<VirtualGateArrangement> QDAC2::Arrange(
	const ContactList& contacts,
	const TriggerPortList& outputTriggers,
	const vector<string>& internalTriggers,
	int outerTriggerChannel)
{
	return unique_ptr<VirtualGateArrangement>(
		new VirtualGateArrangement(*this, contacts, outputTriggers, internalTriggers, outerTriggerChannel));
}

/**
	@brief Creates a virtual gate arrangement from a configuration, then applies its corrections and voltages
 */
unique_ptr<VirtualGateArrangement> QDAC2::Arrange(const ArrangementConfig& config)
{
	auto arrangement = Arrange(
		config.m_contacts,
		config.m_outputTriggers,
		config.m_internalTriggers,
		config.m_outerTriggerChannel);

	arrangement->Configure(config.m_corrections, config.m_virtualVoltages);

	return arrangement;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

void QDAC2::DoSerializeConfiguration(YAML::Node& node)
{
	node["line_frequency_hz"] = m_lineFrequency;
	if(m_roundOff >= 0)
		node["round_off"] = m_roundOff;
}

void QDAC2::DoLoadConfiguration(const YAML::Node& node)
{
	try
	{
		if(node["line_frequency_hz"])
			SetLineFrequency(node["line_frequency_hz"].as<double>());
		if(node["round_off"])
			SetRoundOff(node["round_off"].as<int>());
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Malformed instrument configuration: %s\n", ex.what());
		throw ConfigurationError(string("Malformed instrument configuration: ") + ex.what());
	}
}
