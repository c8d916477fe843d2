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
	@brief Declaration of QDAC2
 */

#ifndef QDAC2_h
#define QDAC2_h

class VirtualGateArrangement;

/**
	@brief A QDevil QDAC-II 24 channel DC voltage source

	Owns its channels and the pool of internal triggers. Arrangements and sweeps created from it keep references to
	both, so the instrument must outlive them.
 */
class QDAC2 : public SCPIInstrument
{
public:
	QDAC2(SCPITransport* transport, const std::string& nickname = "qdac", bool identify = true);
	virtual ~QDAC2();

	virtual std::string GetDriverName() const override
	{ return GetDriverNameInternal(); }

	static std::string GetDriverNameInternal()
	{ return "qdevil_qdac2"; }

	//Hardware resources
	static constexpr int CHANNELS = 24;
	static constexpr int INTERNAL_TRIGGERS = 16;
	static constexpr int EXTERNAL_OUTPUTS = 5;
	static constexpr int EXTERNAL_INPUTS = 4;

	QDAC2Channel& GetQDAC2Channel(int number) const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Triggers

	TriggerPool& GetTriggerPool()
	{ return m_triggers; }

	InternalTrigger AllocateTrigger();

	size_t GetFreeTriggerCount() const
	{ return m_triggers.GetFreeCount(); }

	void FreeAllTriggers();

	void ConnectExternalTrigger(int port, const InternalTrigger& trigger, double width_s = 1e-6);
	void DisconnectExternalTrigger(int port);
	void FireTrigger(const InternalTrigger& trigger);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Instrument wide commands

	void StartAll();
	void AbortAll();
	void Reset();

	std::string GetErrors();
	std::string GetNextError();
	int GetErrorCount();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Settings

	/**
		@brief Line frequency used to convert NPLC to seconds
	 */
	double GetLineFrequency() const
	{ return m_lineFrequency; }

	void SetLineFrequency(double hz);

	/**
		@brief Number of decimals that computed voltages are rounded to, or -1 for no rounding
	 */
	int GetRoundOff() const
	{ return m_roundOff; }

	void SetRoundOff(int decimals);

	double RoundVoltage(double volts) const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Arrangements

	std::unique_ptr<VirtualGateArrangement> Arrange(
		const ContactList& contacts,
		const TriggerPortList& outputTriggers = TriggerPortList(),
		const std::vector<std::string>& internalTriggers = std::vector<std::string>(),
		int outerTriggerChannel = 0);

	std::unique_ptr<VirtualGateArrangement> Arrange(const ArrangementConfig& config);

	static void CheckExternalOutput(int port);

protected:
	void DoSerializeConfiguration(YAML::Node& node);
	void DoLoadConfiguration(const YAML::Node& node);

	TriggerPool m_triggers;

	double m_lineFrequency;
	int m_roundOff;
};

#endif
