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
	@brief Implementation of ArrangementConfig
 */

#include "gatehal.h"

using namespace std;

ArrangementConfig::ArrangementConfig()
	: m_outerTriggerChannel(0)
{
}

/**
	@brief Parses an arrangement description

	@throw ConfigurationError if the document is malformed
 */
ArrangementConfig ArrangementConfig::Load(const YAML::Node& node)
{
	ArrangementConfig ret;

	if(!node.IsMap())
		throw ConfigurationError("Arrangement configuration must be a map");

	try
	{
		auto contacts = node["contacts"];
		if(!contacts || !contacts.IsSequence())
			throw ConfigurationError("Arrangement configuration needs a \"contacts\" list");
		for(auto c : contacts)
		{
			if(!c["name"] || !c["channel"])
				throw ConfigurationError("Each contact needs a name and a channel");
			ret.m_contacts.push_back(pair<string, int>(c["name"].as<string>(), c["channel"].as<int>()));
		}

		auto outputs = node["output_triggers"];
		if(outputs)
		{
			for(auto t : outputs)
			{
				if(!t["name"] || !t["port"])
					throw ConfigurationError("Each output trigger needs a name and a port");
				ret.m_outputTriggers.push_back(pair<string, int>(t["name"].as<string>(), t["port"].as<int>()));
			}
		}

		auto internals = node["internal_triggers"];
		if(internals)
		{
			for(auto t : internals)
				ret.m_internalTriggers.push_back(t.as<string>());
		}

		if(node["outer_trigger_channel"])
			ret.m_outerTriggerChannel = node["outer_trigger_channel"].as<int>();

		auto corrections = node["corrections"];
		if(corrections)
		{
			for(auto c : corrections)
			{
				if(!c["contact"] || !c["row"])
					throw ConfigurationError("Each correction needs a contact and a row");
				ret.m_corrections.push_back(
					pair<string, vector<double> >(c["contact"].as<string>(), c["row"].as< vector<double> >()));
			}
		}

		auto voltages = node["virtual_voltages"];
		if(voltages)
		{
			for(auto it : voltages)
				ret.m_virtualVoltages[it.first.as<string>()] = it.second.as<double>();
		}
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Malformed arrangement configuration: %s\n", ex.what());
		throw ConfigurationError(string("Malformed arrangement configuration: ") + ex.what());
	}

	return ret;
}

/**
	@brief Loads an arrangement description from a YAML file

	The arrangement may either be the whole document or live under an "arrangement" key.
 */
ArrangementConfig ArrangementConfig::LoadFile(const string& path)
{
	YAML::Node doc;
	try
	{
		doc = YAML::LoadFile(path);
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Unable to load %s: %s\n", path.c_str(), ex.what());
		throw ConfigurationError("Unable to load " + path + ": " + ex.what());
	}

	if(doc["arrangement"])
		return Load(doc["arrangement"]);
	return Load(doc);
}

YAML::Node ArrangementConfig::Serialize() const
{
	YAML::Node node;

	for(auto& c : m_contacts)
	{
		YAML::Node cnode;
		cnode["name"] = c.first;
		cnode["channel"] = c.second;
		node["contacts"].push_back(cnode);
	}

	for(auto& t : m_outputTriggers)
	{
		YAML::Node tnode;
		tnode["name"] = t.first;
		tnode["port"] = t.second;
		node["output_triggers"].push_back(tnode);
	}

	for(auto& t : m_internalTriggers)
		node["internal_triggers"].push_back(t);

	if(m_outerTriggerChannel)
		node["outer_trigger_channel"] = m_outerTriggerChannel;

	for(auto& c : m_corrections)
	{
		YAML::Node cnode;
		cnode["contact"] = c.first;
		cnode["row"] = c.second;
		node["corrections"].push_back(cnode);
	}

	for(auto& it : m_virtualVoltages)
		node["virtual_voltages"][it.first] = it.second;

	return node;
}
