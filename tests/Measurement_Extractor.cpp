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
	@brief Tests for MeasurementExtractor
 */

#include <catch2/catch.hpp>

#include "../bodehal/bodehal.h"
#include "../bodehal/TestWaveformSource.h"

using namespace std;

//1 kHz sampled at 1 MS/s, ten whole periods
static const double g_hz = 1e3;
static const float g_period = FS_PER_SECOND / 1e3;
static const int64_t g_sampleperiod = FS_PER_SECOND / 1e6;
static const size_t g_depth = 10000;

static float DegreesToRadians(float deg)
{
	return deg * M_PI / 180;
}

TEST_CASE("Measurement_GainAndPhase")
{
	minstd_rand rng(1);
	TestWaveformSource source(rng);
	MeasurementExtractor extractor;

	struct Case
	{
		float gain;
		float phase;
	};
	vector<Case> cases = { {0.5, -45}, {0.1, 30}, {2, -90}, {0.707, -170}, {1, 175}, {0.02, 0} };

	for(auto& c : cases)
	{
		float startphase = 0.3;
		auto in = source.GenerateNoisySinewave(2, startphase, g_period, g_sampleperiod, g_depth, 0);
		auto out = source.GenerateNoisySinewave(
			2 * c.gain, startphase + DegreesToRadians(c.phase), g_period, g_sampleperiod, g_depth, 0);

		auto r = extractor.Extract(*in, *out, g_hz);
		REQUIRE(r.m_frequency == g_hz);
		REQUIRE(r.m_gain == Approx(20 * log10(c.gain)).margin(0.05));
		REQUIRE(r.m_phase.has_value());
		REQUIRE(MeasurementExtractor::NormalizePhase(*r.m_phase - c.phase) == Approx(0).margin(0.5));
		REQUIRE_FALSE(r.m_lowConfidence);
	}
}

TEST_CASE("Measurement_Noisy")
{
	minstd_rand rng(2);
	TestWaveformSource source(rng);
	MeasurementExtractor extractor;

	auto in = source.GenerateNoisySinewave(2, 1, g_period, g_sampleperiod, g_depth, 0.005);
	auto out = source.GenerateNoisySinewave(1, 1 + DegreesToRadians(-60), g_period, g_sampleperiod, g_depth, 0.005);

	auto r = extractor.Extract(*in, *out, g_hz);
	REQUIRE(r.m_gain == Approx(20 * log10(0.5)).margin(0.1));
	REQUIRE(*r.m_phase == Approx(-60).margin(1));
}

TEST_CASE("Measurement_Idempotent")
{
	minstd_rand rng(3);
	TestWaveformSource source(rng);
	MeasurementExtractor extractor;

	auto in = source.GenerateNoisySinewave(2, 0, g_period, g_sampleperiod, g_depth, 0.01);
	auto out = source.GenerateNoisySinewave(0.3, 0.7, g_period, g_sampleperiod, g_depth, 0.01);

	auto a = extractor.Extract(*in, *out, g_hz);
	auto b = extractor.Extract(*in, *out, g_hz);
	REQUIRE(a.m_gain == b.m_gain);
	REQUIRE(a.m_phase == b.m_phase);
	REQUIRE(a.m_inputRms == b.m_inputRms);
	REQUIRE(a.m_outputRms == b.m_outputRms);
}

TEST_CASE("Measurement_Unity")
{
	minstd_rand rng(4);
	TestWaveformSource source(rng);
	MeasurementExtractor extractor;

	auto in = source.GenerateNoisySinewave(2, 0.5, g_period, g_sampleperiod, g_depth, 0.01);

	auto r = extractor.Extract(*in, *in, g_hz);
	REQUIRE(r.m_gain == 0);
	REQUIRE(r.m_phase.has_value());
	REQUIRE(*r.m_phase == Approx(0).margin(1e-9));
}

TEST_CASE("Measurement_InsufficientSignal")
{
	minstd_rand rng(5);
	TestWaveformSource source(rng);
	MeasurementExtractor extractor(1e-3);

	SECTION("Input below the noise floor")
	{
		auto in = source.GenerateNoisySinewave(1e-3, 0, g_period, g_sampleperiod, g_depth, 0);
		auto out = source.GenerateNoisySinewave(1, 0, g_period, g_sampleperiod, g_depth, 0);
		REQUIRE_THROWS_AS(extractor.Extract(*in, *out, g_hz), InsufficientSignalError);
	}

	SECTION("Output below the noise floor has gain but no phase")
	{
		auto in = source.GenerateNoisySinewave(2, 0, g_period, g_sampleperiod, g_depth, 0);
		auto out = source.GenerateNoisySinewave(2e-3, 0, g_period, g_sampleperiod, g_depth, 0);
		auto r = extractor.Extract(*in, *out, g_hz);
		REQUIRE(r.m_gain == Approx(-60).margin(0.05));
		REQUIRE_FALSE(r.m_phase.has_value());
	}

	SECTION("Empty capture")
	{
		UniformAnalogWaveform empty;
		auto out = source.GenerateNoisySinewave(1, 0, g_period, g_sampleperiod, g_depth, 0);
		REQUIRE_THROWS_AS(extractor.Extract(empty, *out, g_hz), InsufficientSignalError);
	}
}

TEST_CASE("Measurement_LowConfidence")
{
	minstd_rand rng(6);
	TestWaveformSource source(rng);
	MeasurementExtractor extractor(1e-3, 0.4);

	SECTION("Close to Nyquist")
	{
		double hz = 450e3;
		float period = FS_PER_SECOND / hz;
		auto in = source.GenerateNoisySinewave(2, 0, period, g_sampleperiod, g_depth, 0);
		auto out = source.GenerateNoisySinewave(1, 0, period, g_sampleperiod, g_depth, 0);
		auto r = extractor.Extract(*in, *out, hz);
		REQUIRE(r.m_lowConfidence);
	}

	SECTION("Less than one period")
	{
		auto in = source.GenerateNoisySinewave(2, 0, g_period, g_sampleperiod, 500, 0);
		auto out = source.GenerateNoisySinewave(1, 0, g_period, g_sampleperiod, 500, 0);
		auto r = extractor.Extract(*in, *out, g_hz);
		REQUIRE(r.m_lowConfidence);
	}
}

TEST_CASE("Measurement_NormalizePhase")
{
	REQUIRE(MeasurementExtractor::NormalizePhase(0) == 0);
	REQUIRE(MeasurementExtractor::NormalizePhase(190) == Approx(-170));
	REQUIRE(MeasurementExtractor::NormalizePhase(-190) == Approx(170));
	REQUIRE(MeasurementExtractor::NormalizePhase(180) == Approx(180));
	REQUIRE(MeasurementExtractor::NormalizePhase(-180) == Approx(180));
	REQUIRE(MeasurementExtractor::NormalizePhase(540) == Approx(180));
	REQUIRE(MeasurementExtractor::NormalizePhase(-720) == Approx(0).margin(1e-12));
}

TEST_CASE("Measurement_ZeroCrossings")
{
	minstd_rand rng(7);
	TestWaveformSource source(rng);

	//sin starting at phase 0 crosses upwards at 0, 1 ms, 2 ms... The first one has no prior low sample
	auto wfm = source.GenerateNoisySinewave(2, 0, g_period, g_sampleperiod, g_depth, 0);
	vector<double> edges;
	MeasurementExtractor::FindRisingZeroCrossings(*wfm, 0, 0.1, edges);

	REQUIRE(edges.size() == 9);
	for(size_t i=0; i<edges.size(); i++)
		REQUIRE(edges[i] == Approx((i+1) * g_period).margin(g_sampleperiod * 0.01));
}
