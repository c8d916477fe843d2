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
	@brief Implementation of ArrayArrangement
 */

#include "gatehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Validates the whole request, then creates one arrangement per instrument

	@throw InvalidValueError for unknown instruments, reserved controller outputs, contact names used more than once
	and bad channel numbers
	@throw ConfigurationError for bad or reused external outputs and trigger names used more than once
 */
ArrayArrangement::ArrayArrangement(
	QDAC2Array& array,
	const InstrumentContactMap& contacts,
	const InstrumentTriggerMap& outputTriggers,
	const vector<string>& internalTriggers)
	: m_array(array)
	, m_closed(false)
{
	for(auto& it : contacts)
		m_array.GetInstrument(it.first);
	for(auto& it : outputTriggers)
		m_array.GetInstrument(it.first);

	auto controllerOutputs = outputTriggers.find(m_array.GetControllerName());
	if(controllerOutputs != outputTriggers.end())
	{
		for(auto& t : controllerOutputs->second)
		{
			if(QDAC2Array::IsReservedOutput(t.second))
				throw InvalidValueError("External output trigger " + to_string(t.second) + " is reserved");
		}
	}

	set<string> triggerNames(internalTriggers.begin(), internalTriggers.end());
	if(triggerNames.size() != internalTriggers.size())
		throw ConfigurationError("Internal trigger names must be unique");

	m_instrumentNames = m_array.GetNames();
	for(auto& name : m_instrumentNames)
	{
		auto it = contacts.find(name);
		if(it == contacts.end())
			continue;

		set<int> channels;
		for(auto& c : it->second)
		{
			if(!m_contactInstrument.emplace(c.first, name).second)
				throw InvalidValueError("Contact name " + c.first + " used multiple times");
			if( (c.second < 1) || (c.second > QDAC2::CHANNELS) || !channels.insert(c.second).second )
			{
				throw InvalidValueError(
					"Contact \"" + c.first + "\" cannot use channel " + to_string(c.second) + " of " + name);
			}
			m_contactNames.push_back(c.first);
		}
	}

	for(auto& it : outputTriggers)
	{
		set<int> ports;
		for(auto& t : it.second)
		{
			if( (t.second < 1) || (t.second > QDAC2::EXTERNAL_OUTPUTS) || !ports.insert(t.second).second )
			{
				throw ConfigurationError(
					"External output trigger " + to_string(t.second) + " of " + it.first + " is invalid or reused");
			}
			if( (it.first == m_array.GetControllerName()) && !triggerNames.insert(t.first).second )
				throw ConfigurationError("Trigger name " + t.first + " used multiple times");
		}
	}

	LogVerbose("Arranging %zu contacts on %zu instruments\n", m_contactNames.size(), m_instrumentNames.size());
	LogIndenter li;

	for(auto& name : m_instrumentNames)
	{
		auto& qdac = m_array.GetInstrument(name);
		auto c = contacts.find(name);
		auto t = outputTriggers.find(name);
		bool isController = (&qdac == &m_array.GetController());

		m_arrangements[name] = unique_ptr<VirtualGateArrangement>(new VirtualGateArrangement(
			qdac,
			(c == contacts.end()) ? ContactList() : c->second,
			(t == outputTriggers.end()) ? TriggerPortList() : t->second,
			isController ? internalTriggers : vector<string>()));
		OnInstrumentConfigured(name);
	}
}

ArrayArrangement::~ArrayArrangement()
{
	try
	{
		Close();
	}
	catch(const std::exception& ex)
	{
		LogError("Failed to close array arrangement: %s\n", ex.what());
	}
}

/**
	@brief Closes the arrangement of every instrument, controller first
 */
void ArrayArrangement::Close()
{
	m_closed = true;
	for(auto& name : m_instrumentNames)
	{
		auto it = m_arrangements.find(name);
		if(it != m_arrangements.end())
			it->second->Close();
	}
}

void ArrayArrangement::OnInstrumentConfigured(const string& instrument)
{
	LogTrace("Done configuring %s\n", instrument.c_str());
	m_lastConfigured = instrument;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Contacts

/**
	@throw UnknownContactError if no instrument has the contact
 */
string ArrayArrangement::GetInstrumentFor(const string& contact) const
{
	auto it = m_contactInstrument.find(contact);
	if(it == m_contactInstrument.end())
		throw UnknownContactError(contact);
	return it->second;
}

/**
	@throw InvalidValueError if the instrument is not part of the array
 */
VirtualGateArrangement& ArrayArrangement::GetArrangement(const string& instrument) const
{
	auto it = m_arrangements.find(instrument);
	if(it == m_arrangements.end())
		throw InvalidValueError("No instrument named \"" + instrument + "\" in the array");
	return *it->second;
}

QDAC2Channel& ArrayArrangement::GetChannel(const string& contact) const
{
	return GetArrangement(GetInstrumentFor(contact)).GetChannel(contact);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Voltages and currents

double ArrayArrangement::GetVirtualVoltage(const string& contact) const
{
	return GetArrangement(GetInstrumentFor(contact)).GetVirtualVoltage(contact);
}

void ArrayArrangement::SetVirtualVoltage(const string& contact, double volts)
{
	auto instrument = GetInstrumentFor(contact);
	GetArrangement(instrument).SetVirtualVoltage(contact, volts);
	OnInstrumentConfigured(instrument);
}

/**
	@brief Sets several virtual voltages, one batch per instrument in array order

	All contact names are checked before anything is sent.
 */
void ArrayArrangement::SetVirtualVoltages(const map<string, double>& volts)
{
	map< string, map<string, double> > perInstrument;
	for(auto& it : volts)
		perInstrument[GetInstrumentFor(it.first)][it.first] = it.second;

	m_lastConfigured = "";
	for(auto& name : m_instrumentNames)
	{
		auto it = perInstrument.find(name);
		if(it == perInstrument.end())
			continue;
		GetArrangement(name).SetVirtualVoltages(it->second);
		OnInstrumentConfigured(name);
	}
}

/**
	@brief Measures the current of every contact on every instrument

	All instruments are configured first so that a single wait covers them all.

	@return One current per contact, in the order of GetContactNames()
 */
vector<double> ArrayArrangement::CurrentsA(int nplc, const string& range)
{
	if( (range != "low") && (range != "high") )
		throw InvalidValueError("Unknown current range \"" + range + "\"");
	if(nplc < 1)
		throw InvalidValueError("NPLC must be at least 1, got " + to_string(nplc));

	vector<VirtualGateArrangement*> measured;
	for(auto& name : m_instrumentNames)
	{
		auto& a = GetArrangement(name);
		if(!a.GetChannelNumbers().empty())
			measured.push_back(&a);
	}

	for(auto a : measured)
		a->SelectCurrentRange(range);

	//Wait as long as the slowest power line needs
	double lineFrequency = m_array.GetController().GetLineFrequency();
	for(auto a : measured)
	{
		a->PrepareCurrentMeasurement(nplc);
		lineFrequency = min(lineFrequency, a->GetQDAC().GetLineFrequency());
	}

	m_array.GetController().Sleep((nplc + 1) / lineFrequency);

	vector<double> ret;
	for(auto a : measured)
	{
		auto currents = a->ReadCurrents();
		ret.insert(ret.end(), currents.begin(), currents.end());
	}
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Triggers and sweeps

/**
	@brief Gets an internal trigger leased on the controller
 */
const InternalTrigger& ArrayArrangement::GetTriggerByName(const string& name) const
{
	return GetArrangement(m_array.GetControllerName()).GetTriggerByName(name);
}

/**
	@brief Sweeps one contact while all others, on every instrument, stay at their virtual voltage
 */
unique_ptr<VirtualSweep> ArrayArrangement::VirtualSweep1D(
	const string& contact,
	const vector<double>& voltages,
	double stepTime_s,
	const string& stepTrigger,
	int repetitions)
{
	GetInstrumentFor(contact);
	return CreateSweep(SweepGenerator::Steps1D(contact, voltages), stepTime_s, stepTrigger, repetitions);
}

/**
	@brief 2D sweep across instruments, outer-major

	The inner and outer contacts may live on different instruments.
 */
unique_ptr<VirtualSweep> ArrayArrangement::VirtualSweep2D(
	const string& innerContact,
	const vector<double>& innerVoltages,
	const string& outerContact,
	const vector<double>& outerVoltages,
	double innerStepTime_s,
	const string& innerStepTrigger,
	int repetitions)
{
	GetInstrumentFor(innerContact);
	GetInstrumentFor(outerContact);
	auto steps = SweepGenerator::Steps2D(innerContact, innerVoltages, outerContact, outerVoltages);
	return CreateSweep(steps, innerStepTime_s, innerStepTrigger, repetitions);
}

unique_ptr<VirtualSweep> ArrayArrangement::VirtualDetune(
	const vector<string>& contacts,
	const vector<double>& start_V,
	const vector<double>& end_V,
	int steps,
	double stepTime_s,
	const string& stepTrigger,
	int repetitions)
{
	auto sweepSteps = SweepGenerator::StepsDetune(contacts, start_V, end_V, steps);
	for(auto& c : contacts)
		GetInstrumentFor(c);
	return CreateSweep(sweepSteps, stepTime_s, stepTrigger, repetitions);
}

/**
	@brief Arms a sweep on every instrument

	Every channel starts on the common trigger input. The sweep leases a trigger on the controller and routes it to
	the controller's trigger output, so starting the sweep pulses the shared trigger line.
 */
unique_ptr<VirtualSweep> ArrayArrangement::CreateSweep(
	const SweepSteps& steps,
	double stepTime_s,
	const string& stepTrigger,
	int repetitions)
{
	if(m_closed)
		throw InvalidValueError("Cannot sweep on a closed arrangement");

	auto& controller = m_array.GetController();

	SweepSetup setup;
	for(auto& name : m_instrumentNames)
	{
		auto& a = GetArrangement(name);
		auto columns = SweepGenerator::Transpose(SweepGenerator::Evaluate(a, SweepGenerator::Restrict(steps, a)));
		auto contacts = a.GetContactNames();
		for(size_t i=0; i<contacts.size(); i++)
		{
			setup.m_lanes.push_back(SweepLane(
				contacts[i],
				&a.GetChannel(contacts[i]),
				columns.empty() ? vector<double>() : columns[i]));
		}
	}
	setup.m_stepTime = stepTime_s;
	setup.m_repetitions = repetitions;
	setup.m_externalInput = QDAC2Array::COMMON_TRIGGER_IN;
	setup.m_triggerOutPort = QDAC2Array::TRIGGER_OUT;

	//Markers are generated on the controller, where the trigger lives
	if(!stepTrigger.empty())
	{
		setup.m_stepTrigger = &GetTriggerByName(stepTrigger);
		for(auto& lane : setup.m_lanes)
		{
			if(lane.m_channel->GetQDAC() == &controller)
			{
				setup.m_stepChannel = lane.m_channel;
				break;
			}
		}
		if(setup.m_stepChannel == nullptr)
			throw ConfigurationError("Step trigger \"" + stepTrigger + "\" needs a contact on the controller");
	}

	setup.m_instrumentConfigured = sigc::mem_fun(*this, &ArrayArrangement::OnInstrumentConfigured);

	m_lastConfigured = "";
	return unique_ptr<VirtualSweep>(new VirtualSweep(controller, setup));
}
