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
	@brief Declaration of QDAC2Channel
 */

#ifndef QDAC2Channel_h
#define QDAC2Channel_h

class QDAC2;

/**
	@brief One output channel of a QDAC-II

	Stateless proxy: every method emits its commands straight away and nothing is cached or polled. Hardware readiness
	is the caller's business (use one of the query methods if you need to wait).
 */
class QDAC2Channel : public InstrumentChannel
{
public:
	QDAC2Channel(QDAC2* parent, int number);
	virtual ~QDAC2Channel();

	///@brief Gets the 1-based channel number used in "sour<N>" mnemonics
	int GetNumber() const
	{ return m_number; }

	QDAC2* GetQDAC() const
	{ return m_qdac; }

	//Largest output magnitude
	static constexpr double MAX_VOLTAGE = 10.0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// DC output

	void SetVoltageNow(double volts);

	static void ValidateList(const std::vector<double>& volts, double dwell_s, int repetitions, double delay_s = 0);
	void LoadList(
		const std::vector<double>& volts,
		double dwell_s,
		int repetitions = 1,
		bool backwards = false,
		bool stepped = false,
		double delay_s = 0);

	void StartOn(const InternalTrigger& trigger);
	void StartOnExternal(int input);
	void StartImmediate();
	void Abort();

	void SetStepStartMarker(int trigger);

	int GetListPoints();
	int GetListCyclesRemaining();
	std::vector<double> GetListValues();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Zero-span sine used as a marker generator

	void ConfigureSineMarkerWave(double period_s, int cycles);
	void SineStartOn(const InternalTrigger& trigger);
	void SetSinePeriodStartMarker(int trigger);
	void AbortSine();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Current sensing

	void SetCurrentRange(const std::string& range);
	void SetCurrentNplc(int nplc);
	double GetCurrent();

protected:
	void SendDC(const std::string& verb, const std::string& arg);

	QDAC2* m_qdac;
	int m_number;
};

#endif
