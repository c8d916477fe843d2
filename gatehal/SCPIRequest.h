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
	@brief Declaration of SCPIRequest
 */

#ifndef SCPIRequest_h
#define SCPIRequest_h

/**
	@brief One typed argument of a SCPI request
 */
class SCPIArgument
{
public:
	enum ArgumentType
	{
		ARG_NUMBER,			//Floating point value
		ARG_INTEGER,		//Integer value (counts, trigger numbers)
		ARG_KEYWORD,		//Mnemonic such as "fix", "int3", "on"
		ARG_NUMBER_LIST,	//Comma separated floating point values
		ARG_CHANNEL_LIST	//Channel list suffix, e.g. (@1,2,3)
	};

	static SCPIArgument Number(double value);
	static SCPIArgument Integer(int64_t value);
	static SCPIArgument Keyword(const std::string& value);
	static SCPIArgument NumberList(const std::vector<double>& values);
	static SCPIArgument ChannelList(const std::vector<int>& channels);

	ArgumentType GetType() const
	{ return m_type; }

	double GetNumber() const
	{ return m_number; }

	int64_t GetInteger() const
	{ return m_integer; }

	const std::string& GetKeyword() const
	{ return m_keyword; }

	const std::vector<double>& GetNumbers() const
	{ return m_numbers; }

	const std::vector<int>& GetChannels() const
	{ return m_channels; }

	std::string Render() const;

protected:
	SCPIArgument(ArgumentType type)
		: m_type(type)
		, m_number(0)
		, m_integer(0)
	{}

	ArgumentType m_type;
	double m_number;
	int64_t m_integer;
	std::string m_keyword;
	std::vector<double> m_numbers;
	std::vector<int> m_channels;
};

/**
	@brief A single SCPI command or query, kept in typed form until it reaches the transport

	A request is made of a subsystem (e.g. "sour"), an optional 1-based channel or port number appended to the
	subsystem, a verb path (e.g. "list:volt"), a query flag and any number of typed arguments. It is only rendered to
	wire text, e.g. "sour3:list:volt -1,0,1", by Render() when it is handed to the transport.
 */
class SCPIRequest
{
public:
	SCPIRequest(const std::string& subsystem, int channel = 0, const std::string& verb = "");

	static SCPIRequest Query(const std::string& subsystem, int channel = 0, const std::string& verb = "");

	SCPIRequest& Number(double value);
	SCPIRequest& Integer(int64_t value);
	SCPIRequest& Keyword(const std::string& value);
	SCPIRequest& NumberList(const std::vector<double>& values);
	SCPIRequest& ChannelList(const std::vector<int>& channels);

	const std::string& GetSubsystem() const
	{ return m_subsystem; }

	int GetChannel() const
	{ return m_channel; }

	const std::string& GetVerb() const
	{ return m_verb; }

	bool IsQuery() const
	{ return m_query; }

	const std::vector<SCPIArgument>& GetArguments() const
	{ return m_args; }

	std::string Render() const;

protected:
	std::string m_subsystem;
	int m_channel;
	std::string m_verb;
	bool m_query;
	std::vector<SCPIArgument> m_args;
};

#endif
