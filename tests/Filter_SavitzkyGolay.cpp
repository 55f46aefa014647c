/***********************************************************************************************************************
*                                                                                                                      *
* libbodehal                                                                                                           *
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
	@author Andrew D. Zonenberg
	@brief Tests for the plot smoothing filter
 */

#include <catch2/catch.hpp>

#include "../bodehal/bodehal.h"
#include <random>

using namespace std;

TEST_CASE("Filter_SavitzkyGolay")
{
	SavitzkyGolayFilter filter;
	REQUIRE(filter.GetWindow() == 9);
	REQUIRE(filter.GetOrder() == 3);

	SECTION("Even window")
	{
		SavitzkyGolayFilter even(10, 2);
		REQUIRE(even.GetWindow() == 11);
	}

	SECTION("Cubic passes through")
	{
		vector<double> data;
		for(int i=0; i<40; i++)
		{
			double x = (i - 20) * 0.1;
			data.push_back(0.5*x*x*x - 2*x*x + x - 3);
		}

		auto out = filter.Apply(data);
		REQUIRE(out.size() == data.size());
		for(size_t i=0; i<data.size(); i++)
			REQUIRE(out[i] == Approx(data[i]).margin(1e-6));
	}

	SECTION("Short data is left alone")
	{
		vector<double> data = {1, 5, 2, 8, 3};
		REQUIRE(filter.Apply(data) == data);
	}

	SECTION("Impulse response")
	{
		vector<double> data(21, 0);
		data[10] = 1;

		auto out = filter.Apply(data);
		REQUIRE(out[10] == Approx(59.0 / 231));
		REQUIRE(out[9] == Approx(54.0 / 231));
		REQUIRE(out[11] == Approx(54.0 / 231));
		REQUIRE(out[6] == Approx(-21.0 / 231));
		REQUIRE(out[0] == Approx(0).margin(1e-12));
	}

	SECTION("Noise is reduced")
	{
		minstd_rand rng(42);
		normal_distribution<double> noise(0, 1);

		vector<double> data;
		for(int i=0; i<500; i++)
			data.push_back(-10 + noise(rng));

		auto out = filter.Apply(data);

		double inVar = 0;
		double outVar = 0;
		for(size_t i=0; i<data.size(); i++)
		{
			inVar += (data[i] + 10) * (data[i] + 10);
			outVar += (out[i] + 10) * (out[i] + 10);
		}
		REQUIRE(outVar < 0.6 * inVar);
	}
}
