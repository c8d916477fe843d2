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
	@brief Implementation of SCPIRequest
 */

#include "gatehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// SCPIArgument

SCPIArgument SCPIArgument::Number(double value)
{
	SCPIArgument ret(ARG_NUMBER);
	ret.m_number = value;
	return ret;
}

SCPIArgument SCPIArgument::Integer(int64_t value)
{
	SCPIArgument ret(ARG_INTEGER);
	ret.m_integer = value;
	return ret;
}

SCPIArgument SCPIArgument::Keyword(const string& value)
{
	SCPIArgument ret(ARG_KEYWORD);
	ret.m_keyword = value;
	return ret;
}

SCPIArgument SCPIArgument::NumberList(const vector<double>& values)
{
	SCPIArgument ret(ARG_NUMBER_LIST);
	ret.m_numbers = values;
	return ret;
}

SCPIArgument SCPIArgument::ChannelList(const vector<int>& channels)
{
	SCPIArgument ret(ARG_CHANNEL_LIST);
	ret.m_channels = channels;
	return ret;
}

string SCPIArgument::Render() const
{
	switch(m_type)
	{
		case ARG_NUMBER:
			return to_string_scpi(m_number);

		case ARG_INTEGER:
			return to_string(m_integer);

		case ARG_KEYWORD:
			return m_keyword;

		case ARG_NUMBER_LIST:
			return FormatValueList(m_numbers);

		case ARG_CHANNEL_LIST:
			return FormatChannelList(m_channels);

		default:
			return "";
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// SCPIRequest

SCPIRequest::SCPIRequest(const string& subsystem, int channel, const string& verb)
	: m_subsystem(subsystem)
	, m_channel(channel)
	, m_verb(verb)
	, m_query(false)
{
}

SCPIRequest SCPIRequest::Query(const string& subsystem, int channel, const string& verb)
{
	SCPIRequest ret(subsystem, channel, verb);
	ret.m_query = true;
	return ret;
}

SCPIRequest& SCPIRequest::Number(double value)
{
	m_args.push_back(SCPIArgument::Number(value));
	return *this;
}

SCPIRequest& SCPIRequest::Integer(int64_t value)
{
	m_args.push_back(SCPIArgument::Integer(value));
	return *this;
}

SCPIRequest& SCPIRequest::Keyword(const string& value)
{
	m_args.push_back(SCPIArgument::Keyword(value));
	return *this;
}

SCPIRequest& SCPIRequest::NumberList(const vector<double>& values)
{
	m_args.push_back(SCPIArgument::NumberList(values));
	return *this;
}

SCPIRequest& SCPIRequest::ChannelList(const vector<int>& channels)
{
	m_args.push_back(SCPIArgument::ChannelList(channels));
	return *this;
}

/**
	@brief Renders the request as a single line of SCPI text (without terminator)
 */
string SCPIRequest::Render() const
{
	string ret = m_subsystem;
	if(m_channel > 0)
		ret += to_string(m_channel);
	if(!m_verb.empty())
		ret += ":" + m_verb;
	if(m_query)
		ret += "?";

	for(size_t i=0; i<m_args.size(); i++)
	{
		ret += (i == 0) ? " " : ",";
		ret += m_args[i].Render();
	}

	return ret;
}
