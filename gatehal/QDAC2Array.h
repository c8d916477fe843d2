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
	@brief Declaration of QDAC2Array
 */

#ifndef QDAC2Array_h
#define QDAC2Array_h

class ArrayArrangement;

///@brief Contacts of each instrument in an array, by instrument nickname
typedef std::map<std::string, ContactList> InstrumentContactMap;

///@brief External output triggers of each instrument in an array, by instrument nickname
typedef std::map<std::string, TriggerPortList> InstrumentTriggerMap;

/**
	@brief Several QDAC-II instruments sharing a clock and a trigger line

	One instrument is the controller: it distributes its clock to the others (the listeners) and starts synchronized
	operations by routing an internal trigger to its trigger output, which must be wired to the common trigger input
	of every instrument, the controller included.

	The array does not own the instruments, which must outlive it.
 */
class QDAC2Array
{
public:
	QDAC2Array(QDAC2& controller, const std::vector<QDAC2*>& listeners);
	virtual ~QDAC2Array();

	//Controller output wired to the common input of all instruments
	static constexpr int TRIGGER_OUT = 4;

	//Input every instrument starts synchronized operations on
	static constexpr int COMMON_TRIGGER_IN = 3;

	static bool IsReservedOutput(int port)
	{ return (port == 4) || (port == 5); }

	QDAC2& GetController() const
	{ return m_controller; }

	std::string GetControllerName() const
	{ return m_controller.m_nickname; }

	///@brief Gets every instrument, controller first
	const std::vector<QDAC2*>& GetInstruments() const
	{ return m_instruments; }

	std::vector<std::string> GetNames() const;
	QDAC2& GetInstrument(const std::string& name) const;

	void Sync();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Controller triggers

	InternalTrigger AllocateTrigger();
	void ConnectExternalTrigger(int port, const InternalTrigger& trigger, double width_s = 1e-6);
	void FireTrigger(const InternalTrigger& trigger);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Arrangements

	std::unique_ptr<ArrayArrangement> Arrange(
		const InstrumentContactMap& contacts,
		const InstrumentTriggerMap& outputTriggers = InstrumentTriggerMap(),
		const std::vector<std::string>& internalTriggers = std::vector<std::string>());

protected:
	QDAC2& m_controller;

	///@brief Controller followed by the listeners
	std::vector<QDAC2*> m_instruments;
};

#endif
