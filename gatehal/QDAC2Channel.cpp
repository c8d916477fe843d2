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
	@brief Implementation of QDAC2Channel
 */

#include "gatehal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

QDAC2Channel::QDAC2Channel(QDAC2* parent, int number)
	: InstrumentChannel(parent, "ch" + to_string(number), number - 1)
	, m_qdac(parent)
	, m_number(number)
{
}

QDAC2Channel::~QDAC2Channel()
{
}

void QDAC2Channel::SendDC(const string& verb, const string& arg)
{
	m_qdac->SendRequest(SCPIRequest("sour", m_number, verb).Keyword(arg));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// DC output

/**
	@brief Switches the channel to fixed mode and programs a voltage

	@throw InvalidValueError if the voltage is outside the output range (nothing is sent in that case)
 */
void QDAC2Channel::SetVoltageNow(double volts)
{
	if(!std::isfinite(volts) || (fabs(volts) > MAX_VOLTAGE))
	{
		throw InvalidValueError(
			"Voltage " + to_string_scpi(volts) + " on channel " + to_string(m_number) + " is out of range");
	}

	LogTrace("ch%d = %s\n", m_number, Unit(Unit::UNIT_VOLTS).PrettyPrint(volts).c_str());

	SendDC("volt:mode", "fix");
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "volt").Number(volts));
}

/**
	@brief Checks the arguments of LoadList() without touching the hardware

	@throw ConfigurationError describing the first problem found
 */
void QDAC2Channel::ValidateList(const vector<double>& volts, double dwell_s, int repetitions, double delay_s)
{
	if(volts.empty())
		throw ConfigurationError("Voltage list is empty");
	if(!(dwell_s > 0))
		throw ConfigurationError("Dwell time must be positive, got " + to_string_scpi(dwell_s));
	if(!(delay_s >= 0))
		throw ConfigurationError("Delay must not be negative, got " + to_string_scpi(delay_s));

	//-1 means forever
	if( (repetitions == 0) || (repetitions < -1) )
		throw ConfigurationError("Repetitions must be positive or -1, got " + to_string(repetitions));

	for(auto v : volts)
	{
		if(!std::isfinite(v) || (fabs(v) > MAX_VOLTAGE))
			throw ConfigurationError("List voltage " + to_string_scpi(v) + " is out of range");
	}
}

/**
	@brief Uploads a voltage list and arms the list generator

	The list does not play until a trigger arrives: bind one with StartOn(), StartOnExternal() or StartImmediate().

	@param volts		Voltages, in order of playback
	@param dwell_s		Time spent on each point
	@param repetitions	Number of times to play the list, -1 for forever
	@param backwards	Play from the end of the list
	@param stepped		Advance one point per trigger instead of by dwell time
	@param delay_s		Delay between trigger and first point
 */
void QDAC2Channel::LoadList(
	const vector<double>& volts,
	double dwell_s,
	int repetitions,
	bool backwards,
	bool stepped,
	double delay_s)
{
	ValidateList(volts, dwell_s, repetitions, delay_s);

	LogTrace("ch%d: loading %zu point list, dwell %s\n",
		m_number, volts.size(), Unit(Unit::UNIT_SECONDS).PrettyPrint(dwell_s).c_str());

	SendDC("dc:trig:sour", "hold");
	SendDC("volt:mode", "list");
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "list:volt").NumberList(volts));
	SendDC("list:tmod", stepped ? "step" : "auto");
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "list:dwel").Number(dwell_s));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "dc:del").Number(delay_s));
	SendDC("list:dir", backwards ? "down" : "up");
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "list:coun").Integer(repetitions));
	SendDC("dc:trig:sour", "bus");
	SendDC("dc:init:cont", "on");
}

/**
	@brief Starts the armed list whenever an internal trigger fires
 */
void QDAC2Channel::StartOn(const InternalTrigger& trigger)
{
	if(!trigger.IsValid())
		throw InvalidValueError("Cannot start channel " + to_string(m_number) + " on a released trigger");

	SendDC("dc:trig:sour", "int" + to_string(trigger.GetValue()));
	SendDC("dc:init:cont", "on");
}

/**
	@brief Starts the armed list whenever an external trigger input fires
 */
void QDAC2Channel::StartOnExternal(int input)
{
	if( (input < 1) || (input > QDAC2::EXTERNAL_INPUTS) )
		throw InvalidValueError("External input " + to_string(input) + " does not exist");

	SendDC("dc:trig:sour", "ext" + to_string(input));
	SendDC("dc:init:cont", "on");
}

/**
	@brief Plays the armed list once, right now
 */
void QDAC2Channel::StartImmediate()
{
	SendDC("dc:init:cont", "off");
	SendDC("dc:trig:sour", "imm");
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "dc:init"));
}

/**
	@brief Stops any running list and goes back to immediate triggering
 */
void QDAC2Channel::Abort()
{
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "dc:abor"));
	SendDC("dc:trig:sour", "imm");
}

/**
	@brief Fires an internal trigger at the start of every list point (0 disables)
 */
void QDAC2Channel::SetStepStartMarker(int trigger)
{
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "dc:mark:sst").Integer(trigger));
}

int QDAC2Channel::GetListPoints()
{
	return static_cast<int>(m_qdac->QueryNumber(SCPIRequest::Query("sour", m_number, "list:poin")));
}

int QDAC2Channel::GetListCyclesRemaining()
{
	return static_cast<int>(m_qdac->QueryNumber(SCPIRequest::Query("sour", m_number, "list:ncl")));
}

vector<double> QDAC2Channel::GetListValues()
{
	return ParseValueList(m_qdac->QueryRequest(SCPIRequest::Query("sour", m_number, "list:volt")));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Zero-span sine

/**
	@brief Sets up a silent sine wave whose only purpose is to produce period markers

	The wave has zero span and zero offset so the output voltage is unaffected.

	@param period_s		Period of the wave, i.e. time between markers
	@param cycles		Number of periods
 */
void QDAC2Channel::ConfigureSineMarkerWave(double period_s, int cycles)
{
	if(!(period_s > 0))
		throw ConfigurationError("Marker period must be positive, got " + to_string_scpi(period_s));
	if(cycles < 1)
		throw ConfigurationError("Marker wave needs at least one cycle, got " + to_string(cycles));

	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:trig:sour").Keyword("hold"));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:per").Number(period_s));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:pol").Keyword("norm"));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:span").Number(0));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:offs").Number(0));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:slew").Keyword("inf"));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:del").Number(0));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:coun").Integer(cycles));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:trig:sour").Keyword("bus"));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:init:cont").Keyword("on"));
}

void QDAC2Channel::SineStartOn(const InternalTrigger& trigger)
{
	if(!trigger.IsValid())
		throw InvalidValueError("Cannot start channel " + to_string(m_number) + " on a released trigger");

	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:trig:sour").Keyword("int" + to_string(trigger.GetValue())));
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:init:cont").Keyword("on"));
}

/**
	@brief Fires an internal trigger at the start of every sine period (0 disables)
 */
void QDAC2Channel::SetSinePeriodStartMarker(int trigger)
{
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:mark:pstart").Integer(trigger));
}

/**
	@brief Stops the sine generator, clears its marker and goes back to immediate triggering
 */
void QDAC2Channel::AbortSine()
{
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:abor"));
	SetSinePeriodStartMarker(0);
	m_qdac->SendRequest(SCPIRequest("sour", m_number, "sine:trig:sour").Keyword("imm"));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Current sensing

/**
	@brief Selects the current sensor range ("low" or "high")
 */
void QDAC2Channel::SetCurrentRange(const string& range)
{
	if( (range != "low") && (range != "high") )
		throw InvalidValueError("Unknown current range \"" + range + "\"");
	m_qdac->SendRequest(SCPIRequest("sens", m_number, "rang").Keyword(range));
}

void QDAC2Channel::SetCurrentNplc(int nplc)
{
	if(nplc < 1)
		throw InvalidValueError("NPLC must be at least 1, got " + to_string(nplc));
	m_qdac->SendRequest(SCPIRequest("sens", m_number, "nplc").Integer(nplc));
}

/**
	@brief Reads the most recent current measurement of this channel
 */
double QDAC2Channel::GetCurrent()
{
	return m_qdac->QueryNumber(SCPIRequest::Query("sens", m_number, "data:last"));
}
