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
	@brief Declaration of VirtualSweep
 */

#ifndef VirtualSweep_h
#define VirtualSweep_h

/**
	@brief One channel taking part in a sweep, with the physical voltages it will play
 */
class SweepLane
{
public:
	SweepLane(const std::string& contact, QDAC2Channel* channel, const std::vector<double>& values)
		: m_contact(contact)
		, m_channel(channel)
		, m_values(values)
	{}

	std::string m_contact;
	QDAC2Channel* m_channel;
	std::vector<double> m_values;
};

/**
	@brief Everything a VirtualSweep needs to arm the hardware
 */
class SweepSetup
{
public:
	SweepSetup();

	std::vector<SweepLane> m_lanes;

	double m_stepTime;
	int m_repetitions;

	///@brief Trigger that starts the sweep. If null the sweep leases its own from the controller.
	const InternalTrigger* m_startTrigger;

	///@brief Trigger fired at the start of every point, generated by m_stepChannel
	const InternalTrigger* m_stepTrigger;
	QDAC2Channel* m_stepChannel;

	///@brief Silent sine pacer producing outer step markers (2D sweeps only)
	QDAC2Channel* m_outerChannel;
	const InternalTrigger* m_outerTrigger;
	double m_outerPeriod;
	int m_outerCycles;

	///@brief If nonzero, lanes start on this external input instead of the start trigger
	int m_externalInput;

	///@brief If nonzero, the start trigger is routed to this output of the controller
	int m_triggerOutPort;

	///@brief Called with the nickname of each instrument once all of its lanes are armed
	sigc::slot<void(const std::string&)> m_instrumentConfigured;
};

/**
	@brief An armed, synchronized list sweep over one or more channels

	Creating the sweep uploads every list and binds every channel to one shared start trigger, but nothing moves until
	Start() fires it. Close() (also run by the destructor) aborts everything the sweep set up and gives back the start
	trigger if the sweep leased it itself.

	The controller, the channels and any borrowed triggers must outlive the sweep.
 */
class VirtualSweep
{
public:
	VirtualSweep(QDAC2& controller, const SweepSetup& setup);
	virtual ~VirtualSweep();

	VirtualSweep(const VirtualSweep&) =delete;
	VirtualSweep& operator=(const VirtualSweep&) =delete;

	void Start();
	void Close();

	bool IsClosed() const
	{ return m_closed; }

	std::vector<std::string> GetContactNames() const;
	const std::vector<double>& GetActualValues(const std::string& contact) const;

	///@brief Number of points each channel plays per repetition
	size_t GetPointCount() const
	{ return m_lanes.empty() ? 0 : m_lanes[0].m_values.size(); }

	int GetStartTriggerValue() const
	{ return m_startTriggerValue; }

	///@brief Nickname of the last instrument whose lanes were fully armed, empty if none
	const std::string& GetLastConfiguredInstrument() const
	{ return m_lastConfigured; }

protected:
	static void Validate(const SweepSetup& setup);
	void Arm(const SweepSetup& setup);

	QDAC2& m_controller;
	std::vector<SweepLane> m_lanes;

	///@brief Start trigger leased by the sweep itself, invalid if borrowed
	InternalTrigger m_ownTrigger;

	///@brief The trigger actually used to start the sweep (m_ownTrigger or a borrowed one)
	const InternalTrigger* m_startTrigger;
	int m_startTriggerValue;

	QDAC2Channel* m_stepChannel;
	QDAC2Channel* m_outerChannel;
	int m_triggerOutPort;

	std::string m_lastConfigured;

	bool m_closed;
};

#endif
