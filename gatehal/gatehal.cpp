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
	@brief Static initialization and string helpers used throughout the library
 */

#include "gatehal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// String helpers

/**
	@brief Removes whitespace from the start and end of a string
 */
string Trim(const string& str)
{
	string ret;
	string tmp;

	//Skip leading spaces
	size_t i=0;
	for(; i<str.length() && isspace(str[i]); i++)
	{}

	//Read non-space stuff
	for(; i<str.length(); i++)
	{
		//Non-space
		char c = str[i];
		if(!isspace(c))
		{
			ret = ret + tmp + c;
			tmp = "";
		}

		//Space. Save it, only append if we have non-space after
		else
			tmp += c;
	}

	return ret;
}

/**
	@brief Splits a string up into an array separated by delimiters
 */
vector<string> explode(const string& str, char separator)
{
	vector<string> ret;
	string tmp;
	for(auto c : str)
	{
		if(c == separator)
		{
			if(!tmp.empty())
				ret.push_back(tmp);
			tmp = "";
		}
		else
			tmp += c;
	}
	if(!tmp.empty())
		ret.push_back(tmp);
	return ret;
}

/**
	@brief Formats a number for use as a SCPI argument

	Up to 8 significant digits, %g style, so round numbers stay short ("0", "0.5", "1e-06").
	Always uses "." as the decimal separator regardless of the user's locale.
 */
string to_string_scpi(double d)
{
	if(std::isinf(d))
		return (d > 0) ? "inf" : "-inf";

	//Normalize negative zero so it prints as plain "0"
	if(d == 0)
		d = 0;

	char tmp[32];
	snprintf(tmp, sizeof(tmp), "%.8g", d);

	//Some locales use a comma
	string ret(tmp);
	for(auto& c : ret)
	{
		if(c == ',')
			c = '.';
	}
	return ret;
}

/**
	@brief Formats a list of values as a comma separated SCPI argument
 */
string FormatValueList(const vector<double>& values)
{
	string ret;
	for(size_t i=0; i<values.size(); i++)
	{
		if(i > 0)
			ret += ",";
		ret += to_string_scpi(values[i]);
	}
	return ret;
}

/**
	@brief Formats a set of channel numbers as a SCPI channel list suffix, e.g. "(@1,2,3)"
 */
string FormatChannelList(const vector<int>& channels)
{
	string ret = "(@";
	for(size_t i=0; i<channels.size(); i++)
	{
		if(i > 0)
			ret += ",";
		ret += to_string(channels[i]);
	}
	return ret + ")";
}

/**
	@brief Parses a comma separated list of numbers as returned by list queries

	@throw TransportError if any field is not a number
 */
vector<double> ParseValueList(const string& str)
{
	vector<double> ret;
	for(auto& field : explode(Trim(str), ','))
	{
		auto f = Trim(field);
		try
		{
			size_t used = 0;
			ret.push_back(stod(f, &used));
			if(used != f.length())
				throw TransportError("Malformed number \"" + f + "\" in reply \"" + str + "\"");
		}
		catch(const invalid_argument&)
		{
			throw TransportError("Malformed number \"" + f + "\" in reply \"" + str + "\"");
		}
		catch(const out_of_range&)
		{
			throw TransportError("Number \"" + f + "\" out of range in reply \"" + str + "\"");
		}
	}
	return ret;
}
