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
	@brief Declaration of SweepGenerator
 */

#ifndef SweepGenerator_h
#define SweepGenerator_h

class VirtualGateArrangement;

///@brief Virtual voltage overrides for each point of a sweep, by contact name
typedef std::vector< std::map<std::string, double> > SweepSteps;

///@brief Physical voltages, one row per point (or per contact, after Transpose())
typedef std::vector< std::vector<double> > PointTable;

/**
	@brief Computes the points of virtual sweeps

	A sweep is first described as a list of steps, each overriding the virtual voltage of some contacts while the rest
	keep their current value. Evaluate() then turns the steps into physical voltages through an arrangement's
	correction matrix, without touching the arrangement's virtual voltages.
 */
class SweepGenerator
{
public:
	static std::vector<double> Linspace(double start, double end, int steps);
	static std::vector<double> ForwardAndBack(double start, double end, int steps);

	static SweepSteps Steps1D(const std::string& contact, const std::vector<double>& voltages);

	static SweepSteps Steps2D(
		const std::string& innerContact,
		const std::vector<double>& innerVoltages,
		const std::string& outerContact,
		const std::vector<double>& outerVoltages);

	static SweepSteps StepsDetune(
		const std::vector<std::string>& contacts,
		const std::vector<double>& start_V,
		const std::vector<double>& end_V,
		int steps);

	static SweepSteps Restrict(const SweepSteps& steps, const VirtualGateArrangement& arrangement);

	static PointTable Evaluate(const VirtualGateArrangement& arrangement, const SweepSteps& steps);
	static PointTable Transpose(const PointTable& table);
};

#endif
