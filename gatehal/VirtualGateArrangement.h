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
	@brief Declaration of VirtualGateArrangement
 */

#ifndef VirtualGateArrangement_h
#define VirtualGateArrangement_h

class VirtualSweep;

/**
	@brief Named contacts on one QDAC-II, driven through a correction matrix

	Each contact is bound to one channel. The arrangement keeps a vector of virtual voltages v and a square correction
	matrix C, and whenever either changes through one of the mutators below, the physical voltages C*v are pushed to
	every channel in contact order.

	Internal triggers requested by name are leased from the instrument when the arrangement is created and given back
	by Close(), which the destructor also calls.
 */
class VirtualGateArrangement : public ContactArrangement
{
public:
	VirtualGateArrangement(
		QDAC2& qdac,
		const ContactList& contacts,
		const TriggerPortList& outputTriggers = TriggerPortList(),
		const std::vector<std::string>& internalTriggers = std::vector<std::string>(),
		int outerTriggerChannel = 0);
	virtual ~VirtualGateArrangement();

	VirtualGateArrangement(const VirtualGateArrangement&) =delete;
	VirtualGateArrangement& operator=(const VirtualGateArrangement&) =delete;

	QDAC2& GetQDAC() const
	{ return m_qdac; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Contacts

	virtual std::vector<std::string> GetContactNames() const override
	{ return m_contactNames; }

	///@brief Gets the channel numbers, in contact order
	const std::vector<int>& GetChannelNumbers() const
	{ return m_channels; }

	bool HasContact(const std::string& contact) const
	{ return m_contactIndex.find(contact) != m_contactIndex.end(); }

	size_t GetContactIndex(const std::string& contact) const;

	virtual QDAC2Channel& GetChannel(const std::string& contact) const override;

	///@brief Channel used for outer step markers in 2D sweeps, 0 if none
	int GetOuterTriggerChannel() const
	{ return m_outerTriggerChannel; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Voltages

	virtual double GetVirtualVoltage(const std::string& contact) const override;
	virtual void SetVirtualVoltage(const std::string& contact, double volts) override;
	virtual void SetVirtualVoltages(const std::map<std::string, double>& volts) override;

	///@brief Gets the virtual voltages, in contact order
	const std::vector<double>& GetVirtualVoltages() const
	{ return m_virtualVoltages; }

	std::vector<double> GetActualVoltages() const;
	std::vector<double> Evaluate(const std::vector<double>& virtualVoltages) const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Corrections

	void InitiateCorrection(const std::string& contact, const std::vector<double>& row);
	void AddCorrection(const std::string& contact, const std::vector<double>& row);
	void Configure(const CorrectionList& corrections, const std::map<std::string, double>& volts);

	const std::vector< std::vector<double> >& GetCorrectionMatrix() const
	{ return m_correction; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Triggers

	const InternalTrigger& GetTriggerByName(const std::string& name) const;

	bool HasTrigger(const std::string& name) const
	{ return m_triggers.find(name) != m_triggers.end(); }

	std::vector<std::string> GetTriggerNames() const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Currents

	virtual std::vector<double> CurrentsA(int nplc = 1, const std::string& range = "low") override;

	void SelectCurrentRange(const std::string& range);
	void PrepareCurrentMeasurement(int nplc);
	std::vector<double> ReadCurrents();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Sweeps

	std::unique_ptr<VirtualSweep> VirtualSweep1D(
		const std::string& contact,
		const std::vector<double>& voltages,
		double stepTime_s = 1e-5,
		const std::string& startTrigger = "",
		const std::string& stepTrigger = "",
		int repetitions = 1);

	std::unique_ptr<VirtualSweep> VirtualSweep2D(
		const std::string& innerContact,
		const std::vector<double>& innerVoltages,
		const std::string& outerContact,
		const std::vector<double>& outerVoltages,
		double innerStepTime_s = 1e-5,
		const std::string& outerStepTrigger = "",
		const std::string& innerStepTrigger = "",
		const std::string& startTrigger = "",
		int repetitions = 1);

	std::unique_ptr<VirtualSweep> VirtualDetune(
		const std::vector<std::string>& contacts,
		const std::vector<double>& start_V,
		const std::vector<double>& end_V,
		int steps,
		double stepTime_s = 1e-5,
		const std::string& startTrigger = "",
		const std::string& stepTrigger = "",
		int repetitions = 1);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Configuration and lifetime

	ArrangementConfig GetConfiguration() const;
	YAML::Node SerializeConfiguration() const;

	virtual void Close() override;

	bool IsClosed() const
	{ return m_closed; }

protected:
	typedef std::vector< std::vector<double> > Matrix;

	std::vector<double> Evaluate(const Matrix& correction, const std::vector<double>& virtualVoltages) const;
	void Effectuate(const std::vector<double>& v);
	void Effectuate(const Matrix& correction, const std::vector<double>& v);
	void CheckRow(const std::string& contact, const std::vector<double>& row) const;
	std::unique_ptr<VirtualSweep> CreateSweep(
		const std::vector< std::vector<double> >& points,
		double stepTime_s,
		const std::string& startTrigger,
		const std::string& stepTrigger,
		int repetitions,
		QDAC2Channel* outerChannel = nullptr,
		const std::string& outerTrigger = "",
		double outerPeriod_s = 0,
		int outerCycles = 0);

	QDAC2& m_qdac;

	std::vector<std::string> m_contactNames;
	std::map<std::string, size_t> m_contactIndex;
	std::vector<int> m_channels;

	TriggerPortList m_outputTriggers;
	std::vector<std::string> m_internalTriggerNames;

	///@brief Leased triggers, by name (internal triggers and the ones routed to external outputs)
	std::map<std::string, InternalTrigger> m_triggers;

	int m_outerTriggerChannel;

	std::vector< std::vector<double> > m_correction;
	std::vector<double> m_virtualVoltages;

	bool m_closed;
};

#endif
