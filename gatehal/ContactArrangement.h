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
	@brief Declaration of ContactArrangement
 */

#ifndef ContactArrangement_h
#define ContactArrangement_h

class QDAC2Channel;

/**
	@brief A set of named contacts whose virtual voltages can be set and whose currents can be read

	Implemented by VirtualGateArrangement (one instrument) and ArrayArrangement (several instruments). Everything that
	only needs contact level access, such as the leakage characterizer, works on this interface.
 */
class ContactArrangement
{
public:
	virtual ~ContactArrangement();

	///@brief Gets the contact names, in the order used by every per-contact vector
	virtual std::vector<std::string> GetContactNames() const =0;

	///@brief Gets the number of contacts
	size_t GetShape() const
	{ return GetContactNames().size(); }

	virtual QDAC2Channel& GetChannel(const std::string& contact) const =0;

	virtual double GetVirtualVoltage(const std::string& contact) const =0;
	virtual void SetVirtualVoltage(const std::string& contact, double volts) =0;
	virtual void SetVirtualVoltages(const std::map<std::string, double>& volts) =0;

	/**
		@brief Measures the current of every contact

		@param nplc		Integration time, in power line cycles
		@param range	Current range, "low" or "high"

		@return One current per contact, in contact order
	 */
	virtual std::vector<double> CurrentsA(int nplc = 1, const std::string& range = "low") =0;

	std::vector< std::vector<double> > Leakage(double modulation_V, int nplc = 2);

	virtual void Close() =0;
};

#endif
