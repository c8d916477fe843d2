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
	@brief Declaration of SCPINullTransport
 */

#ifndef SCPINullTransport_h
#define SCPINullTransport_h

/**
	@brief Null SCPITransport for simulated instruments

	Commands go nowhere. Queries are answered by a responder slot, which defaults to a simple QDAC-II simulation
	(identification, status byte, error queue and fixed current readings of 0.1 A, 0.2 A, ... per listed channel).
	Test code can swap the responder to inject replies or failures.
 */
class SCPINullTransport : public SCPITransport
{
public:
	SCPINullTransport(const std::string& args);
	virtual ~SCPINullTransport();

	virtual std::string GetConnectionString() override;
	virtual std::string GetName() override;
	static std::string GetTransportName();

	virtual bool SendCommand(const std::string& cmd) override;
	virtual std::string ReadReply() override;

	virtual bool IsConnected() override;

	typedef sigc::slot<std::string(const std::string&)> Responder;

	/**
		@brief Replaces the function used to answer queries
	 */
	void SetResponder(Responder responder)
	{ m_responder = responder; }

	static std::string DefaultResponse(const std::string& query);

protected:
	std::string m_args;

	Responder m_responder;

	///@brief Replies waiting to be read
	std::deque<std::string> m_replies;
};

#endif
