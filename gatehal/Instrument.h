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
	@brief Declaration of Instrument
 */

#ifndef Instrument_h
#define Instrument_h

/**
	@brief An arbitrary lab instrument

	An instrument has one or more channels, all of which occupy a single zero-based namespace.
 */
class Instrument
{
public:
	virtual ~Instrument();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Instrument identification

	//Device information
	virtual std::string GetName() const =0;
	virtual std::string GetVendor() const =0;
	virtual std::string GetSerial() const =0;

	/**
		@brief User-selected nickname of the instrument

		Must be unique among instruments that are used together (for example in a QDAC2Array).
	 */
	std::string m_nickname;

	/**
		@brief Gets the connection string for our transport
	 */
	virtual std::string GetTransportConnectionString() =0;

	/**
		@brief Gets the name of our transport
	 */
	virtual std::string GetTransportName() =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Channel enumeration and identification

	/**
		@brief Gets the number of channels this instrument has.
	 */
	size_t GetChannelCount() const
	{ return m_channels.size(); }

	/**
		@brief Gets a given channel on the instrument

		@param i		Channel index
	 */
	InstrumentChannel* GetChannel(size_t i) const
	{
		if(i >= m_channels.size())
			return nullptr;

		return m_channels[i];
	}

	InstrumentChannel* GetChannelByHwName(const std::string& name);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Serialization

public:

	/**
		@brief Serializes this instrument's configuration to a YAML node.

		@return YAML block with this instrument's configuration
	 */
	virtual YAML::Node SerializeConfiguration() const;

	/**
		@brief Load instrument configuration from a YAML node
	 */
	virtual void LoadConfiguration(const YAML::Node& node);

protected:

	/**
		@brief List of methods which need to be called to serialize this node's configuration
	 */
	std::list< sigc::slot<void(YAML::Node&)> > m_serializers;

	/**
		@brief List of methods which need to be called to deserialize this node's configuration
	 */
	std::list< sigc::slot<void(const YAML::Node&)> > m_loaders;

	/**
		@brief Set of all channels on this instrument
	 */
	std::vector<InstrumentChannel*> m_channels;
};

#endif
