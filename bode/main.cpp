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
	@brief Program entry point
 */

#include "../bodeexports/bodeexports.h"
#include "../bodehal/DemoFunctionGenerator.h"
#include "../bodehal/DemoOscilloscope.h"
#include "CommandLine.h"
#include <signal.h>

using namespace std;

enum ExitCode
{
	EXIT_OK = 0,
	EXIT_USAGE = 1,
	EXIT_SWEEP_FAILED = 2,
	EXIT_EXPORT_FAILED = 3
};

void OnSigint(int sig);

FrequencySweep* g_sweep = nullptr;

int main(int argc, char* argv[])
{
	Severity console_verbosity = Severity::NOTICE;

	//Let the logger eat its args first, then set up logging before anything else can fail
	vector<string> args;
	for(int i=1; i<argc; i++)
	{
		if(ParseLoggerArguments(i, argc, argv, console_verbosity))
			continue;
		args.push_back(argv[i]);
	}
	g_log_sinks.emplace(g_log_sinks.begin(), new ColoredSTDLogSink(console_verbosity));

	SweepConfiguration config;
	switch(CommandLine::Parse(args, config))
	{
		case CommandLine::PARSE_HELP:
			CommandLine::ShowUsage();
			return EXIT_OK;

		case CommandLine::PARSE_ERROR:
			return EXIT_USAGE;

		default:
			break;
	}
	Unit hz(Unit::UNIT_HZ);

	YAML::Emitter out;
	out << config.Serialize();
	LogDebug("Effective configuration:\n%s\n", out.c_str());

	TransportStaticInit();
	DriverStaticInit();

	//Connect to the instruments
	unique_ptr<FunctionGenerator> generator;
	unique_ptr<Oscilloscope> scope;
	if(config.m_demo)
	{
		LogNotice("Using simulated instruments, RC low-pass at %s\n", hz.PrettyPrint(config.m_demoCornerFrequency).c_str());

		auto demogen = new DemoFunctionGenerator;
		generator.reset(demogen);
		auto demoscope = new DemoOscilloscope(*demogen, config.m_demoCornerFrequency, config.m_generatorChannel);
		demoscope->SetNoise(config.m_demoNoise);
		scope.reset(demoscope);
	}
	else
	{
		LogVerbose("Connecting to generator on %s\n", config.m_generatorPort.c_str());
		auto transport = SCPITransport::CreateTransport("uart", config.m_generatorPort);
		if(!transport || !transport->IsConnected())
		{
			LogError("Failed to open generator port %s\n", config.m_generatorPort.c_str());
			delete transport;
			return EXIT_SWEEP_FAILED;
		}
		generator.reset(FunctionGenerator::CreateFunctionGenerator(config.m_generatorDriver, transport));
		if(!generator)
		{
			delete transport;
			return EXIT_SWEEP_FAILED;
		}

		string address = config.m_scopeAddress;
		if(address.empty() || (address == "auto"))
		{
			auto discovery = InstrumentDiscovery::CreateDefault();
			if(!discovery)
			{
				LogError("No scope address given and this build has no instrument discovery, use --ds_ip\n");
				return EXIT_USAGE;
			}
			auto found = discovery->FindOscilloscope(config.m_discoveryTimeoutMs);
			if(!found)
			{
				LogError("No oscilloscope found on the network, use --ds_ip\n");
				return EXIT_SWEEP_FAILED;
			}
			address = *found;
		}
		if(address.find(':') == string::npos)
			address += ":5555";

		LogVerbose("Connecting to scope at %s\n", address.c_str());
		transport = SCPITransport::CreateTransport("lan", address);
		if(!transport || !transport->IsConnected())
		{
			LogError("Failed to connect to scope at %s\n", address.c_str());
			delete transport;
			return EXIT_SWEEP_FAILED;
		}
		scope.reset(Oscilloscope::CreateOscilloscope(config.m_scopeDriver, transport));
		if(!scope)
		{
			delete transport;
			return EXIT_SWEEP_FAILED;
		}
		if(scope->IsOffline())
		{
			LogError("Scope at %s is not responding\n", address.c_str());
			return EXIT_SWEEP_FAILED;
		}
	}
	generator->m_nickname = "awg";
	scope->m_nickname = "scope";
	LogNotice("Generator: %s %s\n", generator->GetVendor().c_str(), generator->GetName().c_str());
	LogNotice("Scope:     %s %s\n", scope->GetVendor().c_str(), scope->GetName().c_str());

	//Run the sweep
	SignalSourceController source(*generator, config.m_generatorChannel);
	CaptureController capture(*scope, config);
	FrequencySweep sweep(source, capture, config);

	size_t total = config.m_points;
	sweep.signal_pointStatus().connect(
		[total, &hz](size_t index, double freq, FrequencySweep::PointState state)
		{
			if( (state == FrequencySweep::POINT_RECORDED) || (state == FrequencySweep::POINT_FAILED) )
			{
				LogVerbose("[%zu/%zu] %s: %s\n",
					index+1, total, hz.PrettyPrint(freq).c_str(), FrequencySweep::GetNameOfState(state).c_str());
			}
			else
				LogTrace("[%zu/%zu] %s\n", index+1, total, FrequencySweep::GetNameOfState(state).c_str());
		});

	g_sweep = &sweep;
	signal(SIGINT, OnSigint);
	auto result = sweep.Run();
	signal(SIGINT, SIG_DFL);
	g_sweep = nullptr;

	if(!result.m_failed.empty())
	{
		LogWarning("%zu points failed:\n", result.m_failed.size());
		LogIndenter li;
		for(auto& f : result.m_failed)
			LogWarning("%s: %s\n", hz.PrettyPrint(f.m_frequency).c_str(), f.m_reason.c_str());
	}

	//Export whatever we have, even after an abort
	int ret = EXIT_OK;
	if(!result.m_recorded.empty() && !ExportSweepResults(result.m_recorded, config))
		ret = EXIT_EXPORT_FAILED;

	if(result.m_aborted)
	{
		LogError("Sweep aborted: %s\n", result.m_abortReason.c_str());
		return EXIT_SWEEP_FAILED;
	}
	if(result.m_recorded.empty())
	{
		LogError("No point could be measured\n");
		return EXIT_SWEEP_FAILED;
	}

	return ret;
}

void OnSigint(int /*sig*/)
{
	if(g_sweep)
		g_sweep->RequestStop();
}
