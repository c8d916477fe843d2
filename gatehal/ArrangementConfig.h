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
	@brief Declaration of ArrangementConfig
 */

#ifndef ArrangementConfig_h
#define ArrangementConfig_h

///@brief Contact name to 1-based channel number, in contact order
typedef std::vector< std::pair<std::string, int> > ContactList;

///@brief Trigger name to external output port
typedef std::vector< std::pair<std::string, int> > TriggerPortList;

///@brief Contact name to one row of the correction matrix
typedef std::vector< std::pair<std::string, std::vector<double> > > CorrectionList;

/**
	@brief Everything needed to build a VirtualGateArrangement, loadable from YAML

	Example:

	contacts:
	  - { name: plunger1, channel: 1 }
	  - { name: plunger2, channel: 2 }
	output_triggers:
	  - { name: dmm, port: 4 }
	internal_triggers: [ wave ]
	outer_trigger_channel: 3
	corrections:
	  - { contact: plunger1, row: [1.0, 0.1] }
	virtual_voltages:
	  plunger1: 0.2
 */
class ArrangementConfig
{
public:
	ArrangementConfig();

	static ArrangementConfig Load(const YAML::Node& node);
	static ArrangementConfig LoadFile(const std::string& path);

	YAML::Node Serialize() const;

	ContactList m_contacts;
	TriggerPortList m_outputTriggers;
	std::vector<std::string> m_internalTriggers;

	///@brief Channel used to generate outer step markers in 2D sweeps, 0 if none
	int m_outerTriggerChannel;

	///@brief Rows of the correction matrix, in order
	CorrectionList m_corrections;

	///@brief Initial virtual voltages, applied in one go after the corrections
	std::map<std::string, double> m_virtualVoltages;
};

#endif
