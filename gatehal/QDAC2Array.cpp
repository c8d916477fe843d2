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
	@brief Implementation of QDAC2Array
 */

#include "gatehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Groups instruments into an array

	@throw InvalidValueError if two instruments have the same nickname
 */
QDAC2Array::QDAC2Array(QDAC2& controller, const vector<QDAC2*>& listeners)
	: m_controller(controller)
{
	m_instruments.push_back(&m_controller);
	for(auto l : listeners)
	{
		if(l == nullptr)
			throw InvalidValueError("Listener instrument must not be null");
		m_instruments.push_back(l);
	}

	set<string> names;
	for(auto q : m_instruments)
		names.insert(q->m_nickname);
	if(names.size() != m_instruments.size())
	{
		string list;
		for(auto q : m_instruments)
			list += (list.empty() ? "" : ", ") + q->m_nickname;
		throw InvalidValueError("Instruments need to have unique names: " + list);
	}

	LogVerbose("Array of %zu instruments, controller %s\n", m_instruments.size(), m_controller.m_nickname.c_str());
}

QDAC2Array::~QDAC2Array()
{
}

vector<string> QDAC2Array::GetNames() const
{
	vector<string> ret;
	for(auto q : m_instruments)
		ret.push_back(q->m_nickname);
	return ret;
}

/**
	@throw InvalidValueError if no instrument has that nickname
 */
QDAC2& QDAC2Array::GetInstrument(const string& name) const
{
	for(auto q : m_instruments)
	{
		if(q->m_nickname == name)
			return *q;
	}
	throw InvalidValueError("No instrument named \"" + name + "\" in the array");
}

/**
	@brief Makes every listener follow the controller's clock and resynchronizes them

	@throw InvalidValueError if the array has only one instrument
 */
void QDAC2Array::Sync()
{
	if(m_instruments.size() < 2)
		throw InvalidValueError("Need at least two instruments to sync");

	LogVerbose("Synchronizing %zu instruments to %s\n", m_instruments.size(), m_controller.m_nickname.c_str());

	m_controller.SendRequest(SCPIRequest("syst:cloc:send").Keyword("on"));
	for(size_t i=1; i<m_instruments.size(); i++)
	{
		m_instruments[i]->SendRequest(SCPIRequest("syst:cloc:sour").Keyword("ext"));
		m_instruments[i]->SendRequest(SCPIRequest("syst:cloc:sync"));
	}
	m_controller.SendRequest(SCPIRequest("syst:cloc:sync"));
	m_controller.SendRequest(SCPIRequest("outp:sync:sign"));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Controller triggers

InternalTrigger QDAC2Array::AllocateTrigger()
{
	return m_controller.AllocateTrigger();
}

void QDAC2Array::ConnectExternalTrigger(int port, const InternalTrigger& trigger, double width_s)
{
	m_controller.ConnectExternalTrigger(port, trigger, width_s);
}

void QDAC2Array::FireTrigger(const InternalTrigger& trigger)
{
	m_controller.FireTrigger(trigger);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Arrangements

/**
	@brief Creates an arrangement spanning several instruments

	@param contacts				Contacts of each instrument, by nickname
	@param outputTriggers		External output triggers of each instrument, by nickname. Outputs 4 and 5 of the
								controller are reserved.
	@param internalTriggers		Names of internal triggers to lease on the controller
 */
unique_ptr<ArrayArrangement> QDAC2Array::Arrange(
	const InstrumentContactMap& contacts,
	const InstrumentTriggerMap& outputTriggers,
	const vector<string>& internalTriggers)
{
	return unique_ptr<ArrayArrangement>(new ArrayArrangement(*this, contacts, outputTriggers, internalTriggers));
}
