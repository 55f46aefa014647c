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
	@brief Tests for CSV and plot output
 */

#include <catch2/catch.hpp>

#include "../bodeexports/bodeexports.h"
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace std;

/**
	@brief Scratch directory removed again at the end of a test
 */
class ScratchDirectory
{
public:
	ScratchDirectory()
	{
		char tmpl[] = "/tmp/bodetest.XXXXXX";
		if(mkdtemp(tmpl))
			m_path = tmpl;
	}

	~ScratchDirectory()
	{
		for(auto& f : List())
			unlink((m_path + "/" + f).c_str());
		rmdir(m_path.c_str());
	}

	std::vector<std::string> List() const
	{
		std::vector<std::string> ret;
		DIR* dir = opendir(m_path.c_str());
		if(!dir)
			return ret;
		while(auto ent = readdir(dir))
		{
			string name = ent->d_name;
			if( (name != ".") && (name != "..") )
				ret.push_back(name);
		}
		closedir(dir);
		return ret;
	}

	std::string m_path;
};

static string ReadFile(const string& path)
{
	string ret;
	FILE* fp = fopen(path.c_str(), "rb");
	if(!fp)
		return ret;
	char buf[4096];
	size_t n;
	while( (n = fread(buf, 1, sizeof(buf), fp)) > 0)
		ret.append(buf, n);
	fclose(fp);
	return ret;
}

static vector<MeasurementResult> GetTestResults()
{
	vector<MeasurementResult> ret;
	double freqs[3] = {1000, 10000, 100000};
	double gains[3] = {-0.0432, -3.01, -20.04};
	double phases[3] = {-5.71, -45, -84.29};
	for(int i=0; i<3; i++)
	{
		MeasurementResult r;
		r.m_frequency = freqs[i];
		r.m_gain = gains[i];
		r.m_phase = phases[i];
		ret.push_back(r);
	}
	return ret;
}

TEST_CASE("Export_CSV")
{
	auto results = GetTestResults();

	SECTION("Gain and phase")
	{
		auto text = CSVExporter(true).Format(results);
		auto lines = explode(Trim(text), '\n');
		REQUIRE(lines.size() == 4);
		REQUIRE(lines[0] == "Frequency in Hz;Gain in dB;Phase in Degree");
		for(auto& l : lines)
			REQUIRE(explode(l, ';').size() == 3);
		REQUIRE(lines[2] == "10000;-3.01;-45");
	}

	SECTION("Gain only")
	{
		auto lines = explode(Trim(CSVExporter(false).Format(results)), '\n');
		REQUIRE(lines.size() == 4);
		REQUIRE(lines[0] == "Frequency in Hz;Gain in dB");
		REQUIRE(lines[1] == "1000;-0.0432");
	}

	SECTION("Missing phase")
	{
		results[1].m_phase.reset();
		auto lines = explode(Trim(CSVExporter(true).Format(results)), '\n');
		REQUIRE(lines[2] == "10000;-3.01;nan");
	}

	SECTION("File")
	{
		ScratchDirectory dir;
		REQUIRE_FALSE(dir.m_path.empty());
		string path = dir.m_path + "/bode.csv";

		CSVExporter(true).Export(results, path);
		REQUIRE(ReadFile(path) == CSVExporter(true).Format(results));

		//Overwrite in place
		results.pop_back();
		CSVExporter(false).Export(results, path);
		REQUIRE(ReadFile(path) == CSVExporter(false).Format(results));
		REQUIRE(dir.List().size() == 1);
	}

	SECTION("Unwritable directory")
	{
		REQUIRE_THROWS_AS(
			CSVExporter(true).Export(results, "/nonexistent/directory/bode.csv"),
			OutputWriteError);
	}

	SECTION("Destination is a directory")
	{
		ScratchDirectory dir;
		string path = dir.m_path + "/bode.csv";
		REQUIRE(mkdir(path.c_str(), 0755) == 0);
		string inner = path + "/keep";
		FILE* fp = fopen(inner.c_str(), "w");
		REQUIRE(fp != nullptr);
		fclose(fp);

		REQUIRE_THROWS_AS(CSVExporter(true).Export(results, path), OutputWriteError);

		//No stray temporary file
		REQUIRE(dir.List().size() == 1);

		unlink(inner.c_str());
		rmdir(path.c_str());
	}
}

TEST_CASE("Export_Plot")
{
	auto results = GetTestResults();
	ScratchDirectory dir;
	REQUIRE_FALSE(dir.m_path.empty());

	SECTION("Ticks")
	{
		REQUIRE(BodePlotRenderer::GetNiceStep(100, 10) == Approx(10));
		REQUIRE(BodePlotRenderer::GetNiceStep(37, 10) == Approx(5));
		REQUIRE(BodePlotRenderer::GetNiceStep(0.9, 10) == Approx(0.1));

		auto ticks = BodePlotRenderer::GetLinearTicks(-42, 3);
		REQUIRE(ticks.front() == Approx(-40));
		REQUIRE(ticks.back() == Approx(0).margin(1e-9));
		REQUIRE(ticks.size() == 9);
	}

	SECTION("PNG")
	{
		static const char signature[] = "\x89PNG\r\n\x1a\n";

		for(bool phase : {false, true})
		{
			string path = dir.m_path + (phase ? "/phase.png" : "/gain.png");
			BodePlotRenderer().Render(results, phase, path);
			auto data = ReadFile(path);
			REQUIRE(data.size() > 8);
			REQUIRE(data.substr(0, 8) == string(signature, 8));
		}

		string path = dir.m_path + "/linear.png";
		BodePlotRenderer(true, false).Render(results, true, path);
		REQUIRE(ReadFile(path).size() > 8);
		REQUIRE(dir.List().size() == 3);
	}

	SECTION("Single point")
	{
		results.resize(1);
		string path = dir.m_path + "/single.png";
		BodePlotRenderer().Render(results, true, path);
		REQUIRE(ReadFile(path).size() > 8);
	}

	SECTION("Nothing to draw")
	{
		string path = dir.m_path + "/empty.png";
		BodePlotRenderer().Render(vector<MeasurementResult>(), true, path);
		REQUIRE(access(path.c_str(), F_OK) != 0);
	}
}

TEST_CASE("Export_SweepResults")
{
	auto results = GetTestResults();
	ScratchDirectory dir;
	REQUIRE_FALSE(dir.m_path.empty());

	SweepConfiguration config;
	config.m_phase = true;
	config.m_csvPath = dir.m_path + "/bode.csv";
	config.m_plotPath = dir.m_path + "/bode.png";

	SECTION("Both")
	{
		REQUIRE(ExportSweepResults(results, config));
		REQUIRE(ReadFile(config.m_csvPath) == CSVExporter(true).Format(results));
		REQUIRE(ReadFile(config.m_plotPath).size() > 8);
	}

	SECTION("CSV fails, plot still written")
	{
		config.m_csvPath = "/nonexistent/directory/bode.csv";
		REQUIRE_FALSE(ExportSweepResults(results, config));
		REQUIRE(ReadFile(config.m_plotPath).size() > 8);
	}

	SECTION("Plot fails, CSV still written")
	{
		config.m_plotPath = "/nonexistent/directory/bode.png";
		REQUIRE_FALSE(ExportSweepResults(results, config));
		REQUIRE(ReadFile(config.m_csvPath) == CSVExporter(true).Format(results));
	}

	SECTION("Nothing configured")
	{
		config.m_csvPath = "";
		config.m_plotPath = "";
		REQUIRE(ExportSweepResults(results, config));
		REQUIRE(dir.List().empty());
	}
}
