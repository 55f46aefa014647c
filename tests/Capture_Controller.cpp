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
	@brief Tests for scope setup and acquisition
 */

#include <catch2/catch.hpp>

#include "../bodehal/bodehal.h"
#include "../bodehal/DemoFunctionGenerator.h"
#include "../bodehal/DemoOscilloscope.h"

using namespace std;

/**
	@brief Simulated scope that never sees a trigger
 */
class DeafDemoOscilloscope : public DemoOscilloscope
{
public:
	DeafDemoOscilloscope(DemoFunctionGenerator& generator)
		: DemoOscilloscope(generator, 10e3)
		, m_stopped(false)
	{}

	virtual Oscilloscope::TriggerMode PollTrigger() override
	{ return TRIGGER_MODE_WAIT; }

	virtual void Stop() override
	{
		m_stopped = true;
		DemoOscilloscope::Stop();
	}

	bool m_stopped;
};

/**
	@brief Simulated scope that has dropped off the network
 */
class OfflineDemoOscilloscope : public DemoOscilloscope
{
public:
	OfflineDemoOscilloscope(DemoFunctionGenerator& generator)
		: DemoOscilloscope(generator, 10e3)
	{}

	virtual bool IsOffline() override
	{ return true; }
};

TEST_CASE("Capture_SelectTimebase")
{
	vector<int64_t> scales = {1000, 2000, 5000, 10000};

	REQUIRE(CaptureController::SelectTimebase(scales, 1500) == 2000);
	REQUIRE(CaptureController::SelectTimebase(scales, 2000) == 2000);
	REQUIRE(CaptureController::SelectTimebase(scales, 10) == 1000);

	//Slower than anything supported
	REQUIRE(CaptureController::SelectTimebase(scales, 50000) == 10000);
}

TEST_CASE("Capture_Setup")
{
	DemoFunctionGenerator gen;
	DemoOscilloscope scope(gen, 10e3);
	SignalSourceController source(gen, 0);
	source.Initialize(5);
	source.SetFrequency(1000, 5);

	SweepConfiguration config;

	SECTION("Automatic")
	{
		CaptureController capture(scope, config);
		capture.Initialize(5);
		REQUIRE(capture.GetExpectedAmplitude(0) == Approx(5));
		REQUIRE(capture.GetExpectedAmplitude(1) == Approx(5));

		//5 periods of 1 kHz over 12 divisions need 416 us/div, next step up is 500
		capture.PrepareForFrequency(1000);
		REQUIRE(scope.GetTimebaseScale() == 500000000000LL);
		REQUIRE(scope.GetChannelVoltageRange(0) == Approx(6.25));
		REQUIRE(scope.GetChannelVoltageRange(1) == Approx(6.25));

		auto wfms = capture.CaptureChannels();
		REQUIRE(wfms.first != nullptr);
		REQUIRE(wfms.second != nullptr);
		REQUIRE(wfms.first->size() == DemoOscilloscope::CAPTURE_DEPTH);
	}

	SECTION("Range floor")
	{
		CaptureController capture(scope, config);
		capture.Initialize(5);
		capture.UpdateExpectedAmplitude(1, 0);
		capture.PrepareForFrequency(1000);
		REQUIRE(scope.GetChannelVoltageRange(1) == Approx(config.m_minimumRange));
	}

	SECTION("Clipping")
	{
		CaptureController capture(scope, config);
		capture.Initialize(5);
		capture.UpdateExpectedAmplitude(0, 1.0);
		capture.PrepareForFrequency(1000);
		REQUIRE(scope.GetChannelVoltageRange(0) == Approx(1.25));

		try
		{
			capture.CaptureChannels();
			FAIL("Clipping not detected");
		}
		catch(const ClippingDetectedError& ex)
		{
			REQUIRE(ex.GetChannel() == 0);
		}

		//Doubling eventually gets the range above the signal
		capture.EscalateRange(0);
		capture.EscalateRange(0);
		capture.EscalateRange(0);
		REQUIRE(capture.GetExpectedAmplitude(0) == Approx(8));
		capture.PrepareForFrequency(1000);
		REQUIRE_NOTHROW(capture.CaptureChannels());
	}

	SECTION("Manual")
	{
		config.m_manualSettings = true;
		scope.SetTimebaseScale(FS_PER_SECOND / 100);
		CaptureController capture(scope, config);
		capture.Initialize(5);
		capture.PrepareForFrequency(1000);
		REQUIRE(scope.GetTimebaseScale() == 10000000000000LL);
		REQUIRE(scope.GetChannelVoltageRange(0) == Approx(8));
	}

	SECTION("Bad channel")
	{
		config.m_outputChannel = 3;
		CaptureController capture(scope, config);
		REQUIRE_THROWS_AS(capture.Initialize(5), DeviceCommunicationError);
	}
}

TEST_CASE("Capture_Timeout")
{
	DemoFunctionGenerator gen;
	DeafDemoOscilloscope scope(gen);
	SignalSourceController source(gen, 0);
	source.Initialize(5);
	source.SetFrequency(10e3, 5);

	SweepConfiguration config;
	config.m_triggerTimeoutMs = 50;
	CaptureController capture(scope, config);
	capture.Initialize(5);
	capture.PrepareForFrequency(10e3);

	REQUIRE_THROWS_AS(capture.CaptureChannels(), CaptureTimeoutError);
	REQUIRE(scope.m_stopped);
}

TEST_CASE("Capture_Offline")
{
	DemoFunctionGenerator gen;
	OfflineDemoOscilloscope scope(gen);

	SweepConfiguration config;
	CaptureController capture(scope, config);
	REQUIRE_THROWS_AS(capture.Initialize(5), DeviceCommunicationError);
}
