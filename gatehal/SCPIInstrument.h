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
	@brief Declaration of SCPIInstrument
 */

#ifndef SCPIInstrument_h
#define SCPIInstrument_h

/**
	@brief An SCPI-based instrument

	All traffic goes through SendRequest() / QueryRequest(), which render typed requests to text, optionally record
	them, and hand them to the transport.
 */
class SCPIInstrument : public virtual Instrument
{
public:
	SCPIInstrument(SCPITransport* transport, bool identify = true);
	virtual ~SCPIInstrument();

	virtual std::string GetTransportConnectionString() override;
	virtual std::string GetTransportName() override;

	virtual std::string GetName() const override;
	virtual std::string GetVendor() const override;
	virtual std::string GetSerial() const override;
	virtual std::string GetDriverName() const =0;

	std::string GetFirmwareVersion() const
	{ return m_fwVersion; }

	SCPITransport* GetTransport() const
	{ return m_transport; }

	void SendRequest(const SCPIRequest& req);
	std::string QueryRequest(const SCPIRequest& req);
	double QueryNumber(const SCPIRequest& req);

	void SendCommand(const std::string& cmd);
	std::string Query(const std::string& cmd);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Command recording

	void StartRecordingSCPI();
	void StopRecordingSCPI();
	std::vector<std::string> GetRecordedSCPICommands();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Blocking waits

	typedef sigc::slot<void(double)> Sleeper;

	/**
		@brief Replaces the function used to wait for hardware (e.g. current integration)
	 */
	void SetSleeper(Sleeper sleeper)
	{ m_sleeper = sleeper; }

	void Sleep(double seconds);

protected:
	void Identify();
	static void DefaultSleep(double seconds);

	void DoSerializeConfiguration(YAML::Node& node);

	SCPITransport* m_transport;

	std::string m_vendor;
	std::string m_model;
	std::string m_serial;
	std::string m_fwVersion;

	bool m_recording;
	std::vector<std::string> m_recordedCommands;

	Sleeper m_sleeper;
};

#endif
