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
	@brief Implementation of VirtualGateArrangement
 */

#include "gatehal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Binds contacts to channels and leases the named triggers

	Everything is validated before the first command is sent.

	@param qdac					Instrument the contacts live on
	@param contacts				Contact names and channel numbers, in contact order
	@param outputTriggers		Names of triggers to lease and route to an external output each
	@param internalTriggers		Names of triggers to lease
	@param outerTriggerChannel	Channel that generates outer step markers in 2D sweeps, 0 for none
 */
VirtualGateArrangement::VirtualGateArrangement(
	QDAC2& qdac,
	const ContactList& contacts,
	const TriggerPortList& outputTriggers,
	const vector<string>& internalTriggers,
	int outerTriggerChannel)
	: m_qdac(qdac)
	, m_outputTriggers(outputTriggers)
	, m_internalTriggerNames(internalTriggers)
	, m_outerTriggerChannel(outerTriggerChannel)
	, m_closed(false)
{
	set<int> channels;
	for(auto& c : contacts)
	{
		if(HasContact(c.first))
			throw InvalidValueError("Contact name " + c.first + " used multiple times");
		if( (c.second < 1) || (c.second > QDAC2::CHANNELS) )
		{
			throw InvalidValueError(
				"Contact \"" + c.first + "\" is bound to channel " + to_string(c.second) + ", which does not exist");
		}
		if(!channels.insert(c.second).second)
			throw InvalidValueError("Channel " + to_string(c.second) + " is bound to more than one contact");

		m_contactIndex[c.first] = m_contactNames.size();
		m_contactNames.push_back(c.first);
		m_channels.push_back(c.second);
	}

	set<string> names;
	for(auto& name : m_internalTriggerNames)
	{
		if(!names.insert(name).second)
			throw ConfigurationError("Trigger name " + name + " used multiple times");
	}
	set<int> ports;
	for(auto& t : m_outputTriggers)
	{
		if( (t.second < 1) || (t.second > QDAC2::EXTERNAL_OUTPUTS) )
			throw ConfigurationError("External output trigger " + to_string(t.second) + " does not exist");
		if(!ports.insert(t.second).second)
			throw ConfigurationError("External output trigger " + to_string(t.second) + " used multiple times");
		if(!names.insert(t.first).second)
			throw ConfigurationError("Trigger name " + t.first + " used multiple times");
	}

	if( (m_outerTriggerChannel < 0) || (m_outerTriggerChannel > QDAC2::CHANNELS) )
		throw InvalidValueError("Outer trigger channel " + to_string(m_outerTriggerChannel) + " does not exist");

	if(names.size() > m_qdac.GetFreeTriggerCount())
	{
		throw ResourceExhaustedError(
			"Arrangement needs " + to_string(names.size()) + " internal triggers, only " +
			to_string(m_qdac.GetFreeTriggerCount()) + " are free");
	}

	//Start out with no correction and everything at zero
	size_t n = m_contactNames.size();
	m_correction.resize(n, vector<double>(n, 0));
	for(size_t i=0; i<n; i++)
		m_correction[i][i] = 1;
	m_virtualVoltages.resize(n, 0);

	LogVerbose("Arranging %zu contacts on %s\n", n, m_qdac.m_nickname.c_str());
	LogIndenter li;

	for(auto& name : m_internalTriggerNames)
	{
		m_triggers.emplace(name, m_qdac.AllocateTrigger());
		LogDebug("Trigger \"%s\" = int%d\n", name.c_str(), m_triggers[name].GetValue());
	}

	for(auto& t : m_outputTriggers)
	{
		auto trigger = m_qdac.AllocateTrigger();
		m_qdac.ConnectExternalTrigger(t.second, trigger);
		LogDebug("Trigger \"%s\" = int%d, routed to external output %d\n",
			t.first.c_str(), trigger.GetValue(), t.second);
		m_triggers.emplace(t.first, std::move(trigger));
	}
}

VirtualGateArrangement::~VirtualGateArrangement()
{
	try
	{
		Close();
	}
	catch(const std::exception& ex)
	{
		LogError("Failed to close arrangement on %s: %s\n", m_qdac.m_nickname.c_str(), ex.what());
	}
}

/**
	@brief Gives back every trigger the arrangement leased and puts its external outputs on hold

	Sweeps created from the arrangement must be closed first. Calling this more than once is harmless.
 */
void VirtualGateArrangement::Close()
{
	if(m_closed)
		return;
	m_closed = true;

	LogDebug("Closing arrangement on %s\n", m_qdac.m_nickname.c_str());

	//Leases stay in the map (invalid) so references handed out by GetTriggerByName() never dangle
	for(auto& it : m_triggers)
		it.second.Release();

	for(auto& t : m_outputTriggers)
		m_qdac.DisconnectExternalTrigger(t.second);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Contacts

/**
	@throw UnknownContactError if there is no such contact
 */
size_t VirtualGateArrangement::GetContactIndex(const string& contact) const
{
	auto it = m_contactIndex.find(contact);
	if(it == m_contactIndex.end())
		throw UnknownContactError(contact);
	return it->second;
}

QDAC2Channel& VirtualGateArrangement::GetChannel(const string& contact) const
{
	return m_qdac.GetQDAC2Channel(m_channels[GetContactIndex(contact)]);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Voltages

double VirtualGateArrangement::GetVirtualVoltage(const string& contact) const
{
	return m_virtualVoltages[GetContactIndex(contact)];
}

/**
	@brief Changes the virtual voltage of one contact and pushes the physical voltage of every channel
 */
void VirtualGateArrangement::SetVirtualVoltage(const string& contact, double volts)
{
	auto v = m_virtualVoltages;
	v[GetContactIndex(contact)] = volts;
	Effectuate(v);
}

/**
	@brief Changes several virtual voltages at once, then pushes the physical voltages once

	@throw UnknownContactError if any contact is unknown, in which case nothing changes
 */
void VirtualGateArrangement::SetVirtualVoltages(const map<string, double>& volts)
{
	auto v = m_virtualVoltages;
	for(auto& it : volts)
		v[GetContactIndex(it.first)] = it.second;
	Effectuate(v);
}

/**
	@brief Gets the corrected voltages of all contacts, C*v
 */
vector<double> VirtualGateArrangement::GetActualVoltages() const
{
	return Evaluate(m_virtualVoltages);
}

/**
	@brief Applies the correction matrix (and the instrument's round-off) to a vector of virtual voltages
 */
vector<double> VirtualGateArrangement::Evaluate(const vector<double>& virtualVoltages) const
{
	return Evaluate(m_correction, virtualVoltages);
}

vector<double> VirtualGateArrangement::Evaluate(const Matrix& correction, const vector<double>& virtualVoltages) const
{
	size_t n = m_contactNames.size();
	if(virtualVoltages.size() != n)
	{
		throw InvalidValueError(
			"Expected " + to_string(n) + " virtual voltages, got " + to_string(virtualVoltages.size()));
	}

	vector<double> ret(n, 0);
	for(size_t i=0; i<n; i++)
	{
		double sum = 0;
		for(size_t j=0; j<n; j++)
			sum += correction[i][j] * virtualVoltages[j];
		ret[i] = m_qdac.RoundVoltage(sum);
	}
	return ret;
}

void VirtualGateArrangement::Effectuate(const vector<double>& v)
{
	Effectuate(m_correction, v);
}

/**
	@brief Makes correction and v current and sets every channel to its corrected voltage, in contact order

	@throw InvalidValueError if any corrected voltage is out of range (nothing changes in that case)
 */
void VirtualGateArrangement::Effectuate(const Matrix& correction, const vector<double>& v)
{
	auto actual = Evaluate(correction, v);
	for(size_t i=0; i<actual.size(); i++)
	{
		if(!std::isfinite(actual[i]) || (fabs(actual[i]) > QDAC2Channel::MAX_VOLTAGE))
		{
			throw InvalidValueError(
				"Corrected voltage " + to_string_scpi(actual[i]) + " of contact \"" + m_contactNames[i] +
				"\" is out of range");
		}
	}

	m_correction = correction;
	m_virtualVoltages = v;
	for(size_t i=0; i<actual.size(); i++)
		m_qdac.GetQDAC2Channel(m_channels[i]).SetVoltageNow(actual[i]);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Corrections

void VirtualGateArrangement::CheckRow(const string& contact, const vector<double>& row) const
{
	if(row.size() != m_contactNames.size())
	{
		throw ConfigurationError(
			"Correction of \"" + contact + "\" has " + to_string(row.size()) + " factors, expected " +
			to_string(m_contactNames.size()));
	}
}

/**
	@brief Replaces the row of the correction matrix that belongs to a contact, then pushes the corrected voltages

	@throw InvalidValueError if the new correction puts any channel out of range (the old row stays in that case)
 */
void VirtualGateArrangement::InitiateCorrection(const string& contact, const vector<double>& row)
{
	auto index = GetContactIndex(contact);
	CheckRow(contact, row);

	auto correction = m_correction;
	correction[index] = row;
	Effectuate(correction, m_virtualVoltages);
}

/**
	@brief Adds a correction on top of the existing ones

	Computes C' = M*C where M is the identity matrix with the contact's row replaced by the given factors. Repeated
	calls compose. The corrected voltages are pushed like for InitiateCorrection().
 */
void VirtualGateArrangement::AddCorrection(const string& contact, const vector<double>& row)
{
	auto index = GetContactIndex(contact);
	CheckRow(contact, row);

	//Only row "index" of M differs from the identity, so only that row of C changes
	size_t n = m_contactNames.size();
	vector<double> updated(n, 0);
	for(size_t j=0; j<n; j++)
	{
		for(size_t k=0; k<n; k++)
			updated[j] += row[k] * m_correction[k][j];
	}
	auto correction = m_correction;
	correction[index] = updated;
	Effectuate(correction, m_virtualVoltages);
}

/**
	@brief Replaces correction rows and virtual voltages in one go, with a single push of the corrected voltages

	Everything is checked first. Nothing is sent when both lists are empty.
 */
void VirtualGateArrangement::Configure(const CorrectionList& corrections, const map<string, double>& volts)
{
	if(corrections.empty() && volts.empty())
		return;

	auto correction = m_correction;
	for(auto& c : corrections)
	{
		auto index = GetContactIndex(c.first);
		CheckRow(c.first, c.second);
		correction[index] = c.second;
	}

	auto v = m_virtualVoltages;
	for(auto& it : volts)
		v[GetContactIndex(it.first)] = it.second;

	Effectuate(correction, v);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Triggers

/**
	@throw UnknownTriggerError if the arrangement did not lease a trigger by that name
 */
const InternalTrigger& VirtualGateArrangement::GetTriggerByName(const string& name) const
{
	auto it = m_triggers.find(name);
	if(it == m_triggers.end())
	{
		LogError("No internal trigger named \"%s\"\n", name.c_str());
		throw UnknownTriggerError(name);
	}
	return it->second;
}

vector<string> VirtualGateArrangement::GetTriggerNames() const
{
	vector<string> ret;
	for(auto& it : m_triggers)
		ret.push_back(it.first);
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Currents

/**
	@brief Measures the current of every contact

	Waits (nplc+1) power line cycles between configuring the sensors and reading them.
 */
vector<double> VirtualGateArrangement::CurrentsA(int nplc, const string& range)
{
	if(m_channels.empty())
		return vector<double>();

	SelectCurrentRange(range);
	PrepareCurrentMeasurement(nplc);
	m_qdac.Sleep((nplc + 1) / m_qdac.GetLineFrequency());
	return ReadCurrents();
}

void VirtualGateArrangement::SelectCurrentRange(const string& range)
{
	if( (range != "low") && (range != "high") )
		throw InvalidValueError("Unknown current range \"" + range + "\"");

	m_qdac.SendRequest(SCPIRequest("sens", 0, "rang").Keyword(range).ChannelList(m_channels));
}

/**
	@brief Waits for the range relays to settle and sets the integration time of every channel
 */
void VirtualGateArrangement::PrepareCurrentMeasurement(int nplc)
{
	if(nplc < 1)
		throw InvalidValueError("NPLC must be at least 1, got " + to_string(nplc));

	//Any query completes only once the relays are done switching
	m_qdac.QueryRequest(SCPIRequest::Query("*stb"));
	m_qdac.SendRequest(SCPIRequest("sens", 0, "nplc").Integer(nplc).ChannelList(m_channels));
}

/**
	@brief Reads the current of every channel in one go

	@throw TransportError if the reply does not hold one value per contact
 */
vector<double> VirtualGateArrangement::ReadCurrents()
{
	SCPIRequest req = SCPIRequest::Query("read").ChannelList(m_channels);
	auto currents = ParseValueList(m_qdac.QueryRequest(req));
	if(currents.size() != m_channels.size())
	{
		throw TransportError(
			"Expected " + to_string(m_channels.size()) + " currents in reply to \"" + req.Render() + "\", got " +
			to_string(currents.size()));
	}

	Unit amps(Unit::UNIT_AMPS);
	for(size_t i=0; i<currents.size(); i++)
		LogTrace("%s: %s\n", m_contactNames[i].c_str(), amps.PrettyPrint(currents[i]).c_str());

	return currents;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Sweeps

/**
	@brief Sweeps one contact while the others stay at their current virtual voltage

	Every channel gets a list, since the correction matrix may couple the swept contact to any of them. The virtual
	voltages of the arrangement are not changed.

	@param contact		Contact to sweep
	@param voltages		Virtual voltages of the swept contact
	@param stepTime_s	Time spent on each point
	@param startTrigger	Name of an arrangement trigger that starts the sweep, empty to lease a new one
	@param stepTrigger	Name of an arrangement trigger to fire at the start of every point, empty for none
	@param repetitions	Number of times to play the sweep, -1 for forever
 */
unique_ptr<VirtualSweep> VirtualGateArrangement::VirtualSweep1D(
	const string& contact,
	const vector<double>& voltages,
	double stepTime_s,
	const string& startTrigger,
	const string& stepTrigger,
	int repetitions)
{
	GetContactIndex(contact);
	auto points = SweepGenerator::Evaluate(*this, SweepGenerator::Steps1D(contact, voltages));
	return CreateSweep(points, stepTime_s, startTrigger, stepTrigger, repetitions);
}

/**
	@brief Sweeps two contacts, the inner one once for every value of the outer one

	If outerStepTrigger is given, the arrangement's outer trigger channel runs a silent sine whose period is one
	inner sweep, and fires that trigger at the start of every period.

	@throw ConfigurationError if an outer step trigger is requested but the arrangement has no outer trigger channel
 */
unique_ptr<VirtualSweep> VirtualGateArrangement::VirtualSweep2D(
	const string& innerContact,
	const vector<double>& innerVoltages,
	const string& outerContact,
	const vector<double>& outerVoltages,
	double innerStepTime_s,
	const string& outerStepTrigger,
	const string& innerStepTrigger,
	const string& startTrigger,
	int repetitions)
{
	GetContactIndex(innerContact);
	GetContactIndex(outerContact);

	QDAC2Channel* outerChannel = nullptr;
	if(!outerStepTrigger.empty())
	{
		if(m_outerTriggerChannel == 0)
			throw ConfigurationError("Arrangement needs an outer trigger channel when using an outer step trigger");
		outerChannel = &m_qdac.GetQDAC2Channel(m_outerTriggerChannel);
	}

	auto steps = SweepGenerator::Steps2D(innerContact, innerVoltages, outerContact, outerVoltages);
	auto points = SweepGenerator::Evaluate(*this, steps);
	return CreateSweep(
		points,
		innerStepTime_s,
		startTrigger,
		innerStepTrigger,
		repetitions,
		outerChannel,
		outerStepTrigger,
		innerVoltages.size() * innerStepTime_s,
		static_cast<int>(outerVoltages.size()));
}

/**
	@brief Moves several contacts linearly between two sets of voltages and back

	@throw InvalidValueError unless contacts, start_V and end_V have the same length
 */
unique_ptr<VirtualSweep> VirtualGateArrangement::VirtualDetune(
	const vector<string>& contacts,
	const vector<double>& start_V,
	const vector<double>& end_V,
	int steps,
	double stepTime_s,
	const string& startTrigger,
	const string& stepTrigger,
	int repetitions)
{
	auto sweepSteps = SweepGenerator::StepsDetune(contacts, start_V, end_V, steps);
	for(auto& c : contacts)
		GetContactIndex(c);
	auto points = SweepGenerator::Evaluate(*this, sweepSteps);
	return CreateSweep(points, stepTime_s, startTrigger, stepTrigger, repetitions);
}

/**
	@brief Turns a table of physical points into an armed sweep over every channel of the arrangement
 */
unique_ptr<VirtualSweep> VirtualGateArrangement::CreateSweep(
	const PointTable& points,
	double stepTime_s,
	const string& startTrigger,
	const string& stepTrigger,
	int repetitions,
	QDAC2Channel* outerChannel,
	const string& outerTrigger,
	double outerPeriod_s,
	int outerCycles)
{
	if(m_closed)
		throw InvalidValueError("Cannot sweep on a closed arrangement");

	auto columns = SweepGenerator::Transpose(points);

	SweepSetup setup;
	for(size_t i=0; i<m_contactNames.size(); i++)
	{
		setup.m_lanes.push_back(SweepLane(
			m_contactNames[i],
			&m_qdac.GetQDAC2Channel(m_channels[i]),
			columns.empty() ? vector<double>() : columns[i]));
	}
	setup.m_stepTime = stepTime_s;
	setup.m_repetitions = repetitions;

	if(!startTrigger.empty())
		setup.m_startTrigger = &GetTriggerByName(startTrigger);

	if(!stepTrigger.empty())
	{
		setup.m_stepTrigger = &GetTriggerByName(stepTrigger);
		if(!setup.m_lanes.empty())
			setup.m_stepChannel = setup.m_lanes[0].m_channel;
	}

	if(outerChannel != nullptr)
	{
		setup.m_outerChannel = outerChannel;
		setup.m_outerTrigger = &GetTriggerByName(outerTrigger);
		setup.m_outerPeriod = outerPeriod_s;
		setup.m_outerCycles = outerCycles;
	}

	return unique_ptr<VirtualSweep>(new VirtualSweep(m_qdac, setup));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Configuration

/**
	@brief Describes the arrangement in its current state

	The correction matrix is written out row by row and the virtual voltages in full, so passing the result to
	QDAC2::Arrange() recreates an identical arrangement.
 */
ArrangementConfig VirtualGateArrangement::GetConfiguration() const
{
	ArrangementConfig config;
	for(size_t i=0; i<m_contactNames.size(); i++)
	{
		config.m_contacts.push_back(pair<string, int>(m_contactNames[i], m_channels[i]));
		config.m_corrections.push_back(pair<string, vector<double> >(m_contactNames[i], m_correction[i]));
		config.m_virtualVoltages[m_contactNames[i]] = m_virtualVoltages[i];
	}
	config.m_outputTriggers = m_outputTriggers;
	config.m_internalTriggers = m_internalTriggerNames;
	config.m_outerTriggerChannel = m_outerTriggerChannel;
	return config;
}

YAML::Node VirtualGateArrangement::SerializeConfiguration() const
{
	return GetConfiguration().Serialize();
}
