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
	@brief Implementation of LeakageCharacterizer
 */

#include "gatehal.h"

#include <cmath>

using namespace std;

LeakageCharacterizer::LeakageCharacterizer(ContactArrangement& arrangement)
	: m_arrangement(arrangement)
{
}

/**
	@brief Measures the leakage matrix

	Entry [i][j] is the change of the current of contact j per volt on contact i, (I+ - I-)/modulation_V, where I+
	and I- are measured at +modulation_V/2 and -modulation_V/2 around the virtual voltage of contact i.

	Each contact gets its original virtual voltage back after its round, also when a measurement fails.

	@param modulation_V		Peak to peak modulation
	@param nplc				Integration time of each measurement, in power line cycles
	@param range			Current range, "low" or "high"

	@return Conductance matrix in siemens, one row per modulated contact
 */
LeakageCharacterizer::Matrix LeakageCharacterizer::Run(double modulation_V, int nplc, const string& range)
{
	if(!std::isfinite(modulation_V) || (modulation_V == 0))
		throw InvalidValueError("Modulation voltage must be nonzero, got " + to_string_scpi(modulation_V));

	auto contacts = m_arrangement.GetContactNames();
	LogVerbose("Measuring leakage of %zu contacts, modulation %s\n",
		contacts.size(), Unit(Unit::UNIT_VOLTS).PrettyPrint(modulation_V).c_str());
	LogIndenter li;

	m_steadyState = m_arrangement.CurrentsA(nplc, range);

	Matrix ret;
	for(auto& contact : contacts)
	{
		double original = m_arrangement.GetVirtualVoltage(contact);

		vector<double> plus;
		vector<double> minus;
		try
		{
			m_arrangement.SetVirtualVoltage(contact, original + modulation_V/2);
			plus = m_arrangement.CurrentsA(nplc, range);
			m_arrangement.SetVirtualVoltage(contact, original - modulation_V/2);
			minus = m_arrangement.CurrentsA(nplc, range);
		}
		catch(const std::exception& ex)
		{
			LogError("Leakage measurement of \"%s\" failed, restoring its voltage: %s\n", contact.c_str(), ex.what());
			m_arrangement.SetVirtualVoltage(contact, original);
			throw;
		}
		m_arrangement.SetVirtualVoltage(contact, original);

		if( (plus.size() != contacts.size()) || (minus.size() != contacts.size()) )
			throw TransportError("Expected one current per contact while modulating \"" + contact + "\"");

		vector<double> row;
		for(size_t j=0; j<contacts.size(); j++)
			row.push_back( (plus[j] - minus[j]) / modulation_V );

		LogDebug("%s: %s\n", contact.c_str(), FormatValueList(row).c_str());
		ret.push_back(row);
	}

	return ret;
}

/**
	@brief Converts a conductance matrix to resistances, |1/g|

	Zero conductance gives an infinite resistance.
 */
LeakageCharacterizer::Matrix LeakageCharacterizer::ToResistance(const Matrix& conductance)
{
	Matrix ret;
	for(auto& row : conductance)
	{
		vector<double> r;
		for(auto g : row)
		{
			if(g == 0)
				r.push_back(numeric_limits<double>::infinity());
			else
				r.push_back(fabs(1 / g));
		}
		ret.push_back(r);
	}
	return ret;
}
