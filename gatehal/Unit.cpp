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
	@brief Implementation of Unit
 */

#include "gatehal.h"

#include <cmath>
#include <limits>

using namespace std;

/**
	@brief Converts a string to a unit
 */
Unit::Unit(const string& rhs)
{
	if(rhs == "s")
		m_type = UNIT_SECONDS;
	else if(rhs == "Hz")
		m_type = UNIT_HZ;
	else if(rhs == "V")
		m_type = UNIT_VOLTS;
	else if(rhs == "A")
		m_type = UNIT_AMPS;
	else if(rhs == "Ω")
		m_type = UNIT_OHMS;
	else if(rhs == "S")
		m_type = UNIT_SIEMENS;
	else if(rhs == "PLC")
		m_type = UNIT_PLC;
	else
		m_type = UNIT_COUNTS;
}

/**
	@brief Converts this unit to a string
 */
string Unit::ToString() const
{
	return GetUnitSuffix();
}

string Unit::GetUnitSuffix() const
{
	switch(m_type)
	{
		case UNIT_SECONDS:
			return "s";

		case UNIT_HZ:
			return "Hz";

		case UNIT_VOLTS:
			return "V";

		case UNIT_AMPS:
			return "A";

		case UNIT_OHMS:
			return "Ω";

		case UNIT_SIEMENS:
			return "S";

		case UNIT_PLC:
			return "PLC";

		default:
			return "";
	}
}

/**
	@brief Gets the appropriate SI scaling factor for a number.
 */
void Unit::GetSIScalingFactor(double num, double& scaleFactor, string& prefix) const
{
	scaleFactor = 1;
	prefix = "";
	num = fabs(num);

	//No prefixes on dimensionless values, and zero is zero
	if( (m_type == UNIT_COUNTS) || (m_type == UNIT_PLC) || (num == 0) )
		return;

	if(num >= 1e12)
	{
		scaleFactor = 1e-12;
		prefix = "T";
	}
	else if(num >= 1e9)
	{
		scaleFactor = 1e-9;
		prefix = "G";
	}
	else if(num >= 1e6)
	{
		scaleFactor = 1e-6;
		prefix = "M";
	}
	else if(num >= 1e3)
	{
		scaleFactor = 1e-3;
		prefix = "k";
	}
	else if(num >= 1)
		return;
	else if(num >= 1e-3)
	{
		scaleFactor = 1e3;
		prefix = "m";
	}
	else if(num >= 1e-6)
	{
		scaleFactor = 1e6;
		prefix = "μ";
	}
	else if(num >= 1e-9)
	{
		scaleFactor = 1e9;
		prefix = "n";
	}
	else if(num >= 1e-12)
	{
		scaleFactor = 1e12;
		prefix = "p";
	}
	else
	{
		scaleFactor = 1e15;
		prefix = "f";
	}
}

/**
	@brief Prints a value with SI scaling factors

	@param value				The value
	@param sigfigs				Number of significant digits to display, or -1 to pick automatically
 */
string Unit::PrettyPrint(double value, int sigfigs) const
{
	if(fabs(value) >= std::numeric_limits<double>::max())
		return UNIT_OVERLOAD_LABEL;

	double scaleFactor;
	string prefix;
	GetSIScalingFactor(value, scaleFactor, prefix);
	auto suffix = GetUnitSuffix();

	double value_rescaled = value * scaleFactor;

	char tmp[128];
	if(sigfigs > 0)
	{
		int leftdigits = 0;
		if(fabs(value_rescaled) >= 100)
			leftdigits = 3;
		else if(fabs(value_rescaled) >= 10)
			leftdigits = 2;
		else
			leftdigits = 1;
		int rightdigits = max(0, sigfigs - leftdigits);

		snprintf(tmp, sizeof(tmp), "%.*f %s%s", rightdigits, value_rescaled, prefix.c_str(), suffix.c_str());
	}

	//If not a round number, add more digits (up to 5)
	else
	{
		int digits = 5;
		for(int i=0; i<5; i++)
		{
			double scale = pow(10, i);
			if(fabs(round(value_rescaled*scale) - value_rescaled*scale) < 0.001)
			{
				digits = i;
				break;
			}
		}
		snprintf(tmp, sizeof(tmp), "%.*f %s%s", digits, value_rescaled, prefix.c_str(), suffix.c_str());
	}

	return Trim(tmp);
}
