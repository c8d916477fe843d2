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
	@brief Implementation of SweepGenerator
 */

#include "gatehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Value sequences

/**
	@brief Evenly spaced values from start to end, both included

	The last value is exactly end, not start plus an accumulated step.
 */
vector<double> SweepGenerator::Linspace(double start, double end, int steps)
{
	if(steps < 1)
		throw InvalidValueError("Need at least one step, got " + to_string(steps));

	vector<double> ret;
	if(steps == 1)
	{
		ret.push_back(start);
		return ret;
	}

	double step = (end - start) / (steps - 1);
	for(int i=0; i<steps; i++)
		ret.push_back(start + i*step);
	ret[steps - 1] = end;
	return ret;
}

/**
	@brief Goes from start to end in the given number of steps, then back towards start

	Neither end point is repeated on the way back, so the sequence can be played in a loop without a jump:
	ForwardAndBack(-1, 1, 3) is -1, 0, 1, 0.
 */
vector<double> SweepGenerator::ForwardAndBack(double start, double end, int steps)
{
	auto ret = Linspace(start, end, steps);
	for(int i=steps-2; i>0; i--)
		ret.push_back(ret[i]);
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Steps

SweepSteps SweepGenerator::Steps1D(const string& contact, const vector<double>& voltages)
{
	SweepSteps ret;
	for(auto v : voltages)
	{
		map<string, double> step;
		step[contact] = v;
		ret.push_back(step);
	}
	return ret;
}

/**
	@brief Outer-major 2D steps: the inner contact runs through all its values for every outer value
 */
SweepSteps SweepGenerator::Steps2D(
	const string& innerContact,
	const vector<double>& innerVoltages,
	const string& outerContact,
	const vector<double>& outerVoltages)
{
	if(innerContact == outerContact)
		throw InvalidValueError("Inner and outer contact are both \"" + innerContact + "\"");

	SweepSteps ret;
	for(auto outer : outerVoltages)
	{
		for(auto inner : innerVoltages)
		{
			map<string, double> step;
			step[outerContact] = outer;
			step[innerContact] = inner;
			ret.push_back(step);
		}
	}
	return ret;
}

/**
	@brief Moves several contacts at once, each from its start to its end voltage and back

	@throw InvalidValueError unless there is exactly one start and one end voltage per contact
 */
SweepSteps SweepGenerator::StepsDetune(
	const vector<string>& contacts,
	const vector<double>& start_V,
	const vector<double>& end_V,
	int steps)
{
	if(contacts.size() != start_V.size())
		throw InvalidValueError("There must be exactly one voltage per contact: got " + FormatValueList(start_V));
	if(contacts.size() != end_V.size())
		throw InvalidValueError("There must be exactly one voltage per contact: got " + FormatValueList(end_V));

	vector< vector<double> > sequences;
	for(size_t i=0; i<contacts.size(); i++)
		sequences.push_back(ForwardAndBack(start_V[i], end_V[i], steps));

	SweepSteps ret;
	size_t npoints = sequences.empty() ? 0 : sequences[0].size();
	for(size_t n=0; n<npoints; n++)
	{
		map<string, double> step;
		for(size_t i=0; i<contacts.size(); i++)
			step[contacts[i]] = sequences[i][n];
		ret.push_back(step);
	}
	return ret;
}

/**
	@brief Drops the overrides of contacts that are not part of an arrangement
 */
SweepSteps SweepGenerator::Restrict(const SweepSteps& steps, const VirtualGateArrangement& arrangement)
{
	SweepSteps ret;
	for(auto& step : steps)
	{
		map<string, double> mine;
		for(auto& it : step)
		{
			if(arrangement.HasContact(it.first))
				mine.insert(it);
		}
		ret.push_back(mine);
	}
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Evaluation

/**
	@brief Computes the physical voltages of every step

	Each step starts from the arrangement's current virtual voltages, so overrides never leak from one step into the
	next and the arrangement itself is left unchanged.

	@throw UnknownContactError if a step names a contact the arrangement does not have
 */
PointTable SweepGenerator::Evaluate(const VirtualGateArrangement& arrangement, const SweepSteps& steps)
{
	PointTable ret;
	for(auto& step : steps)
	{
		auto v = arrangement.GetVirtualVoltages();
		for(auto& it : step)
			v[arrangement.GetContactIndex(it.first)] = it.second;
		ret.push_back(arrangement.Evaluate(v));
	}
	return ret;
}

PointTable SweepGenerator::Transpose(const PointTable& table)
{
	PointTable ret;
	if(table.empty())
		return ret;

	ret.resize(table[0].size());
	for(auto& row : table)
	{
		for(size_t i=0; i<row.size() && i<ret.size(); i++)
			ret[i].push_back(row[i]);
	}
	return ret;
}
