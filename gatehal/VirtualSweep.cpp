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
	@brief Implementation of VirtualSweep
 */

#include "gatehal.h"

using namespace std;

SweepSetup::SweepSetup()
	: m_stepTime(1e-5)
	, m_repetitions(1)
	, m_startTrigger(nullptr)
	, m_stepTrigger(nullptr)
	, m_stepChannel(nullptr)
	, m_outerChannel(nullptr)
	, m_outerTrigger(nullptr)
	, m_outerPeriod(0)
	, m_outerCycles(0)
	, m_externalInput(0)
	, m_triggerOutPort(0)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Validates the setup, then uploads and arms everything

	Nothing is sent if validation fails. If a command fails half way, the instruments already configured are left
	as they are; the exception is logged along with the last instrument that was fully armed, and propagated.
 */
VirtualSweep::VirtualSweep(QDAC2& controller, const SweepSetup& setup)
	: m_controller(controller)
	, m_lanes(setup.m_lanes)
	, m_startTrigger(setup.m_startTrigger)
	, m_startTriggerValue(0)
	, m_stepChannel(nullptr)
	, m_outerChannel(nullptr)
	, m_triggerOutPort(0)
	, m_closed(false)
{
	Validate(setup);

	if(m_startTrigger == nullptr)
	{
		m_ownTrigger = m_controller.AllocateTrigger();
		m_startTrigger = &m_ownTrigger;
	}
	m_startTriggerValue = m_startTrigger->GetValue();

	LogVerbose("Arming sweep: %zu channels, %zu points, start trigger %d\n",
		m_lanes.size(), GetPointCount(), m_startTriggerValue);
	LogIndenter li;

	try
	{
		Arm(setup);
	}
	catch(const GatehalError& ex)
	{
		LogError("Sweep setup failed (last configured instrument: \"%s\"): %s\n", m_lastConfigured.c_str(), ex.what());
		throw;
	}
}

VirtualSweep::~VirtualSweep()
{
	try
	{
		Close();
	}
	catch(const std::exception& ex)
	{
		LogError("Failed to close sweep: %s\n", ex.what());
	}
}

/**
	@throw ConfigurationError if the setup is inconsistent
 */
void VirtualSweep::Validate(const SweepSetup& setup)
{
	if(setup.m_lanes.empty())
		throw ConfigurationError("Sweep has no channels");

	auto npoints = setup.m_lanes[0].m_values.size();
	for(auto& lane : setup.m_lanes)
	{
		if(lane.m_channel == nullptr)
			throw ConfigurationError("Contact \"" + lane.m_contact + "\" has no channel");
		if(lane.m_values.size() != npoints)
		{
			throw ConfigurationError(
				"Contact \"" + lane.m_contact + "\" has " + to_string(lane.m_values.size()) +
				" points, expected " + to_string(npoints));
		}
		QDAC2Channel::ValidateList(lane.m_values, setup.m_stepTime, setup.m_repetitions);
	}

	if( (setup.m_startTrigger != nullptr) && !setup.m_startTrigger->IsValid() )
		throw ConfigurationError("Start trigger has already been released");

	if(setup.m_stepTrigger != nullptr)
	{
		if(!setup.m_stepTrigger->IsValid())
			throw ConfigurationError("Step trigger has already been released");
		if(setup.m_stepChannel == nullptr)
			throw ConfigurationError("Step trigger needs a channel to generate it");
	}

	if(setup.m_outerChannel != nullptr)
	{
		if(setup.m_outerTrigger == nullptr)
			throw ConfigurationError("Outer step marker needs a trigger");
		if(!setup.m_outerTrigger->IsValid())
			throw ConfigurationError("Outer step trigger has already been released");
		if(!(setup.m_outerPeriod > 0) || (setup.m_outerCycles < 1))
			throw ConfigurationError("Outer step marker needs a positive period and at least one cycle");
	}

	if( (setup.m_externalInput < 0) || (setup.m_externalInput > QDAC2::EXTERNAL_INPUTS) )
		throw ConfigurationError("External input " + to_string(setup.m_externalInput) + " does not exist");

	if(setup.m_triggerOutPort != 0)
	{
		try
		{
			QDAC2::CheckExternalOutput(setup.m_triggerOutPort);
		}
		catch(const InvalidValueError& ex)
		{
			throw ConfigurationError(ex.what());
		}
	}
}

/**
	@brief Sends the whole setup to the hardware
 */
void VirtualSweep::Arm(const SweepSetup& setup)
{
	//All channels step together, so one of them is enough to mark the steps
	if(setup.m_stepTrigger != nullptr)
	{
		m_stepChannel = setup.m_stepChannel;
		m_stepChannel->SetStepStartMarker(setup.m_stepTrigger->GetValue());
	}

	for(size_t i=0; i<m_lanes.size(); i++)
	{
		auto& lane = m_lanes[i];
		LogTrace("%s: %zu points on ch%d\n", lane.m_contact.c_str(), lane.m_values.size(), lane.m_channel->GetNumber());

		lane.m_channel->LoadList(lane.m_values, setup.m_stepTime, setup.m_repetitions);
		if(setup.m_externalInput)
			lane.m_channel->StartOnExternal(setup.m_externalInput);
		else
			lane.m_channel->StartOn(*m_startTrigger);

		//Lanes are grouped by instrument
		auto qdac = lane.m_channel->GetQDAC();
		bool lastOfInstrument = (i+1 == m_lanes.size()) || (m_lanes[i+1].m_channel->GetQDAC() != qdac);
		if(lastOfInstrument)
		{
			m_lastConfigured = qdac->m_nickname;
			if(!setup.m_instrumentConfigured.empty())
				setup.m_instrumentConfigured(m_lastConfigured);
		}
	}

	if(setup.m_triggerOutPort)
	{
		m_triggerOutPort = setup.m_triggerOutPort;
		m_controller.ConnectExternalTrigger(m_triggerOutPort, *m_startTrigger);
	}

	if(setup.m_outerChannel != nullptr)
	{
		m_outerChannel = setup.m_outerChannel;
		m_outerChannel->ConfigureSineMarkerWave(setup.m_outerPeriod, setup.m_outerCycles);
		m_outerChannel->SineStartOn(*m_startTrigger);
		m_outerChannel->SetSinePeriodStartMarker(setup.m_outerTrigger->GetValue());
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Running

/**
	@brief Fires the start trigger

	@throw InvalidValueError if the sweep has been closed
 */
void VirtualSweep::Start()
{
	if(m_closed)
		throw InvalidValueError("Cannot start a closed sweep");

	LogVerbose("Starting sweep on trigger %d\n", m_startTriggerValue);
	m_controller.FireTrigger(*m_startTrigger);
}

/**
	@brief Aborts every channel, removes the markers and gives back the sweep's own trigger

	Safe to call whether or not the sweep was started, and more than once.
 */
void VirtualSweep::Close()
{
	if(m_closed)
		return;
	m_closed = true;

	//Goes back to the pool on the way out, even if one of the commands below fails
	InternalTrigger own(std::move(m_ownTrigger));

	LogDebug("Closing sweep\n");

	if(m_stepChannel)
		m_stepChannel->SetStepStartMarker(0);

	for(auto& lane : m_lanes)
		lane.m_channel->Abort();

	if(m_triggerOutPort)
		m_controller.DisconnectExternalTrigger(m_triggerOutPort);

	if(m_outerChannel)
		m_outerChannel->AbortSine();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

vector<string> VirtualSweep::GetContactNames() const
{
	vector<string> ret;
	for(auto& lane : m_lanes)
		ret.push_back(lane.m_contact);
	return ret;
}

/**
	@brief Gets the physical voltages a contact's channel will play

	@throw UnknownContactError if the contact is not part of the sweep
 */
const vector<double>& VirtualSweep::GetActualValues(const string& contact) const
{
	for(auto& lane : m_lanes)
	{
		if(lane.m_contact == contact)
			return lane.m_values;
	}
	throw UnknownContactError(contact);
}
