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
	@brief Declaration of ArrayArrangement
 */

#ifndef ArrayArrangement_h
#define ArrayArrangement_h

/**
	@brief Named contacts spread over the instruments of a QDAC2Array

	Made of one VirtualGateArrangement per instrument, with the controller's first. Internal triggers are only leased
	on the controller. Operations touching several instruments are not transactional: if one instrument fails half
	way, the ones before it stay configured. GetLastConfiguredInstrument() tells how far it got.
 */
class ArrayArrangement : public ContactArrangement
{
public:
	ArrayArrangement(
		QDAC2Array& array,
		const InstrumentContactMap& contacts,
		const InstrumentTriggerMap& outputTriggers = InstrumentTriggerMap(),
		const std::vector<std::string>& internalTriggers = std::vector<std::string>());
	virtual ~ArrayArrangement();

	ArrayArrangement(const ArrayArrangement&) =delete;
	ArrayArrangement& operator=(const ArrayArrangement&) =delete;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Contacts

	virtual std::vector<std::string> GetContactNames() const override
	{ return m_contactNames; }

	const std::vector<std::string>& GetInstrumentNames() const
	{ return m_instrumentNames; }

	std::string GetInstrumentFor(const std::string& contact) const;
	VirtualGateArrangement& GetArrangement(const std::string& instrument) const;

	virtual QDAC2Channel& GetChannel(const std::string& contact) const override;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Voltages and currents

	virtual double GetVirtualVoltage(const std::string& contact) const override;
	virtual void SetVirtualVoltage(const std::string& contact, double volts) override;
	virtual void SetVirtualVoltages(const std::map<std::string, double>& volts) override;

	virtual std::vector<double> CurrentsA(int nplc = 1, const std::string& range = "low") override;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Triggers and sweeps

	const InternalTrigger& GetTriggerByName(const std::string& name) const;

	std::unique_ptr<VirtualSweep> VirtualSweep1D(
		const std::string& contact,
		const std::vector<double>& voltages,
		double stepTime_s = 1e-5,
		const std::string& stepTrigger = "",
		int repetitions = 1);

	std::unique_ptr<VirtualSweep> VirtualSweep2D(
		const std::string& innerContact,
		const std::vector<double>& innerVoltages,
		const std::string& outerContact,
		const std::vector<double>& outerVoltages,
		double innerStepTime_s = 1e-5,
		const std::string& innerStepTrigger = "",
		int repetitions = 1);

	std::unique_ptr<VirtualSweep> VirtualDetune(
		const std::vector<std::string>& contacts,
		const std::vector<double>& start_V,
		const std::vector<double>& end_V,
		int steps,
		double stepTime_s = 1e-5,
		const std::string& stepTrigger = "",
		int repetitions = 1);

	///@brief Nickname of the last instrument a multi-instrument operation finished with, empty if none
	const std::string& GetLastConfiguredInstrument() const
	{ return m_lastConfigured; }

	virtual void Close() override;

	bool IsClosed() const
	{ return m_closed; }

protected:
	std::unique_ptr<VirtualSweep> CreateSweep(
		const SweepSteps& steps,
		double stepTime_s,
		const std::string& stepTrigger,
		int repetitions);

	void OnInstrumentConfigured(const std::string& instrument);

	QDAC2Array& m_array;

	///@brief Instrument nicknames, controller first
	std::vector<std::string> m_instrumentNames;

	std::map< std::string, std::unique_ptr<VirtualGateArrangement> > m_arrangements;

	///@brief Contact names, controller's first, each instrument's in its own contact order
	std::vector<std::string> m_contactNames;

	///@brief Owning instrument of each contact
	std::map<std::string, std::string> m_contactInstrument;

	std::string m_lastConfigured;

	bool m_closed;
};

#endif
