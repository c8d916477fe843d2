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
	@brief Declaration of the exception classes thrown by libgatehal
 */

#ifndef GatehalErrors_h
#define GatehalErrors_h

/**
	@brief Base class for all errors reported by libgatehal
 */
class GatehalError : public std::runtime_error
{
public:
	explicit GatehalError(const std::string& what)
		: std::runtime_error(what)
	{}
};

/**
	@brief No free internal trigger is left in a TriggerPool
 */
class ResourceExhaustedError : public GatehalError
{
public:
	explicit ResourceExhaustedError(const std::string& what)
		: GatehalError(what)
	{}
};

/**
	@brief A contact name was looked up that is not part of the arrangement
 */
class UnknownContactError : public GatehalError
{
public:
	explicit UnknownContactError(const std::string& contact)
		: GatehalError("No contact named \"" + contact + "\"")
		, m_contact(contact)
	{}

	const std::string& GetContact() const
	{ return m_contact; }

protected:
	std::string m_contact;
};

/**
	@brief A trigger name was looked up that the arrangement never allocated
 */
class UnknownTriggerError : public GatehalError
{
public:
	explicit UnknownTriggerError(const std::string& trigger)
		: GatehalError("No internal trigger named \"" + trigger + "\"")
		, m_trigger(trigger)
	{}

	const std::string& GetTrigger() const
	{ return m_trigger; }

protected:
	std::string m_trigger;
};

/**
	@brief Inconsistent setup: mismatched lengths, missing outer trigger channel, reused ports, bad config files
 */
class ConfigurationError : public GatehalError
{
public:
	explicit ConfigurationError(const std::string& what)
		: GatehalError(what)
	{}
};

/**
	@brief Invalid argument values (duplicate names, too few instruments, reserved ports)
 */
class InvalidValueError : public GatehalError
{
public:
	explicit InvalidValueError(const std::string& what)
		: GatehalError(what)
	{}
};

/**
	@brief The transport failed to send a command or returned an unusable reply
 */
class TransportError : public GatehalError
{
public:
	explicit TransportError(const std::string& what)
		: GatehalError(what)
	{}
};

#endif
