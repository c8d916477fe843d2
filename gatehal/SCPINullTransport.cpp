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
	@brief Implementation of SCPINullTransport
 */

#include "gatehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SCPINullTransport::SCPINullTransport(const string& args)
	: m_args(args)
	, m_responder(sigc::ptr_fun(&SCPINullTransport::DefaultResponse))
{
}

SCPINullTransport::~SCPINullTransport()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Actual transport code

string SCPINullTransport::GetTransportName()
{
	return "null";
}

string SCPINullTransport::GetName()
{
	return GetTransportName();
}

string SCPINullTransport::GetConnectionString()
{
	return m_args;
}

bool SCPINullTransport::IsConnected()
{
	return true;
}

bool SCPINullTransport::SendCommand(const string& cmd)
{
	LogTrace("Sending %s\n", cmd.c_str());

	//Anything with a question mark in the mnemonic expects an answer
	auto mnemonic = cmd.substr(0, cmd.find(' '));
	if(mnemonic.find('?') != string::npos)
		m_replies.push_back(m_responder(cmd));
	return true;
}

string SCPINullTransport::ReadReply()
{
	if(m_replies.empty())
	{
		LogWarning("SCPINullTransport: read with no reply pending\n");
		return "";
	}

	auto ret = m_replies.front();
	m_replies.pop_front();
	LogTrace("Got %s\n", ret.c_str());
	return ret;
}

/**
	@brief Answers a query the way an idle QDAC-II would
 */
string SCPINullTransport::DefaultResponse(const string& query)
{
	auto mnemonic = query.substr(0, query.find(' '));

	if(mnemonic == "*IDN?")
		return "QDevil,QDAC-II,00000,0.0.0";

	if( (mnemonic == "syst:err?") || (mnemonic == "syst:err:all?") )
		return "0,\"No error\"";

	//One fake current per channel in the list: 0.1, 0.2, 0.3...
	if(mnemonic == "read?")
	{
		auto start = query.find("(@");
		auto end = query.find(')', start);
		if( (start == string::npos) || (end == string::npos) )
			return "";
		auto nchans = explode(query.substr(start + 2, end - start - 2), ',').size();
		string ret;
		for(size_t i=0; i<nchans; i++)
		{
			if(i > 0)
				ret += ",";
			ret += to_string_scpi(0.1 * (i+1));
		}
		return ret;
	}

	return "0";
}
