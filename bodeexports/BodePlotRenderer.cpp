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
	@brief Implementation of BodePlotRenderer
 */

#include "bodeexports.h"
#include <unistd.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

BodePlotRenderer::BodePlotRenderer(bool linear, bool smoothing)
	: m_linear(linear)
	, m_smoothing(smoothing)
	, m_filter(9, 3)
	, m_width(1000)
	, m_panelHeight(450)
	, m_lmargin(80)
	, m_rmargin(30)
	, m_tmargin(40)
	, m_bmargin(50)
	, m_top(0)
	, m_bottom(0)
	, m_left(0)
	, m_right(0)
	, m_fmin(1)
	, m_fmax(10)
	, m_vmin(0)
	, m_vmax(1)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Axis scaling

/**
	@brief Rounds span/maxTicks up to 1, 2 or 5 times a power of ten
 */
double BodePlotRenderer::GetNiceStep(double span, size_t maxTicks)
{
	if( (span <= 0) || (maxTicks == 0) )
		return 1;

	double raw = span / maxTicks;
	double mag = pow(10, floor(log10(raw)));
	for(auto m : {1, 2, 5, 10})
	{
		if(m * mag >= raw)
			return m * mag;
	}
	return 10 * mag;
}

/**
	@brief Evenly spaced round values covering [vmin, vmax]
 */
vector<double> BodePlotRenderer::GetLinearTicks(double vmin, double vmax, size_t maxTicks)
{
	vector<double> ret;
	double step = GetNiceStep(vmax - vmin, maxTicks);
	for(double v = ceil(vmin / step) * step; v <= vmax + step*1e-6; v += step)
		ret.push_back(fabs(v) < step*1e-6 ? 0 : v);
	return ret;
}

float BodePlotRenderer::FrequencyToPosition(double hz)
{
	double frac;
	if(m_linear)
		frac = (hz - m_fmin) / (m_fmax - m_fmin);
	else
		frac = (log10(hz) - log10(m_fmin)) / (log10(m_fmax) - log10(m_fmin));
	return m_left + frac * (m_right - m_left);
}

float BodePlotRenderer::ValueToPosition(double v)
{
	return m_bottom - (v - m_vmin) / (m_vmax - m_vmin) * (m_bottom - m_top);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Rendering

/**
	@brief Draws the plot and writes it to path

	@throw OutputWriteError if the PNG cannot be written. No partial file is left behind.
 */
void BodePlotRenderer::Render(const vector<MeasurementResult>& results, bool showPhase, const string& path)
{
	if(results.empty())
	{
		LogWarning("No results, not writing %s\n", path.c_str());
		return;
	}

	vector<double> freqs;
	vector<double> gains;
	vector<double> phaseFreqs;
	vector<double> phases;
	for(auto& r : results)
	{
		freqs.push_back(r.m_frequency);
		gains.push_back(r.m_gain);
		if(r.m_phase)
		{
			phaseFreqs.push_back(r.m_frequency);
			phases.push_back(*r.m_phase);
		}
	}

	//Both panels share the frequency axis
	m_fmin = freqs.front();
	m_fmax = freqs.back();
	if(m_fmax <= m_fmin)
	{
		if(m_linear)
		{
			m_fmin -= 1;
			m_fmax += 1;
		}
		else
		{
			m_fmin /= 2;
			m_fmax *= 2;
		}
	}

	int panels = showPhase ? 2 : 1;
	auto surface = Cairo::ImageSurface::create(Cairo::FORMAT_ARGB32, m_width, m_panelHeight * panels);
	auto cr = Cairo::Context::create(surface);

	cr->set_source_rgb(1, 1, 1);
	cr->paint();

	char title[128];
	snprintf(title, sizeof(title), "Amplitude diagram (N=%zu)", results.size());
	DrawPanel(cr, 0, title, "Gain [dB]", freqs, gains, Unit(Unit::UNIT_DB));

	if(showPhase)
	{
		snprintf(title, sizeof(title), "Phase diagram (N=%zu)", phases.size());
		DrawPanel(cr, m_panelHeight, title, "Phase [°]", phaseFreqs, phases, Unit(Unit::UNIT_DEGREES));
	}

	surface->flush();

	auto tmp = MakeTempFile(path);
	try
	{
		surface->write_to_png(tmp);
	}
	catch(const std::exception& ex)
	{
		unlink(tmp.c_str());
		throw OutputWriteError(string("Failed to write ") + path + ": " + ex.what());
	}
	ReplaceFile(tmp, path);

	LogNotice("Wrote plot to %s\n", path.c_str());
}

void BodePlotRenderer::DrawPanel(
	const Cairo::RefPtr<Cairo::Context>& cr,
	int top,
	const string& title,
	const string& ylabel,
	const vector<double>& freqs,
	const vector<double>& values,
	Unit yunit)
{
	//Calculate dimensions
	m_top = top + m_tmargin;
	m_bottom = top + m_panelHeight - m_bmargin;
	m_left = m_lmargin;
	m_right = m_width - m_rmargin;
	float bodywidth = m_right - m_left;
	float bodyheight = m_bottom - m_top;

	cr->save();

		//Title
		cr->set_source_rgb(0, 0, 0);
		int tw, th;
		GetStringWidth(cr, title, true, tw, th);
		DrawString(m_left + (bodywidth - tw)/2, top + (m_tmargin - th)/2, cr, title, true);

		//Y axis title
		DrawStringVertical(10, m_top + bodyheight/2, cr, ylabel);

		//X axis title
		string xlabel = "Frequency [Hz]";
		GetStringWidth(cr, xlabel, false, tw, th);
		DrawString(m_left + (bodywidth - tw)/2, m_bottom + m_bmargin - th - 5, cr, xlabel, false);

		if(values.empty())
		{
			DrawString(m_left + 10, m_top + 10, cr, "No data", false);
			cr->restore();
			return;
		}

		//Vertical scale with a bit of padding
		m_vmin = *min_element(values.begin(), values.end());
		m_vmax = *max_element(values.begin(), values.end());
		double pad = max((m_vmax - m_vmin) * 0.05, 0.5);
		m_vmin -= pad;
		m_vmax += pad;

		//Draw axes
		cr->set_line_width(1.0);
		cr->move_to(m_left + 0.5, m_top);
		cr->line_to(m_left + 0.5, m_bottom + 0.5);
		cr->line_to(m_right + 0.5, m_bottom + 0.5);
		cr->stroke();

		//Draw grid
		vector<double> dashes;
		dashes.push_back(1);
		cr->set_dash(dashes, 0);
		cr->set_line_width(0.5);

		Unit hz(Unit::UNIT_HZ);
		vector<pair<double, bool> > xticks;
		if(m_linear)
		{
			for(auto f : GetLinearTicks(m_fmin, m_fmax))
				xticks.push_back(pair<double, bool>(f, true));
		}
		else
		{
			//Decades are labeled, 2-9 times a decade get a bare line
			for(double decade = pow(10, floor(log10(m_fmin))); decade <= m_fmax; decade *= 10)
			{
				for(int m=1; m<10; m++)
				{
					double f = decade * m;
					if( (f >= m_fmin) && (f <= m_fmax) )
						xticks.push_back(pair<double, bool>(f, m == 1));
				}
			}
		}
		for(auto t : xticks)
		{
			float pos = FrequencyToPosition(t.first);
			cr->move_to(static_cast<int>(pos) + 0.5, m_bottom + 0.5);
			cr->line_to(static_cast<int>(pos) + 0.5, m_top);
			cr->stroke();
		}

		auto yticks = GetLinearTicks(m_vmin, m_vmax);
		for(auto v : yticks)
		{
			float pos = ValueToPosition(v);
			cr->move_to(m_left, static_cast<int>(pos) + 0.5);
			cr->line_to(m_right, static_cast<int>(pos) + 0.5);
			cr->stroke();
		}
		cr->unset_dash();

		//Tick labels
		cr->set_line_width(1.0);
		for(auto t : xticks)
		{
			if(!t.second)
				continue;
			auto str = hz.PrettyPrint(t.first);
			GetStringWidth(cr, str, false, tw, th);
			DrawString(FrequencyToPosition(t.first) - tw/2, m_bottom + 5, cr, str, false);
		}
		for(auto v : yticks)
		{
			auto str = yunit.PrettyPrint(v);
			GetStringWidth(cr, str, false, tw, th);
			DrawString(m_left - tw - 5, ValueToPosition(v) - th/2, cr, str, false);
		}

		//Measured data
		cr->set_source_rgb(0.12, 0.47, 0.71);
		cr->set_line_width(1.5);
		DrawSeries(cr, freqs, values);
		int legendy = m_top + 5;
		DrawString(m_right - 120, legendy, cr, "Measured data", false);

		//Smoothed overlay
		if(m_smoothing && (values.size() >= m_filter.GetWindow()))
		{
			cr->set_source_rgb(0.84, 0.15, 0.16);
			vector<double> longdashes;
			longdashes.push_back(6);
			longdashes.push_back(4);
			cr->set_dash(longdashes, 0);
			DrawSeries(cr, freqs, m_filter.Apply(values));
			cr->unset_dash();
			DrawString(m_right - 120, legendy + th + 5, cr, "Smoothed data", false);
		}

	cr->restore();
}

void BodePlotRenderer::DrawSeries(
	const Cairo::RefPtr<Cairo::Context>& cr,
	const vector<double>& freqs,
	const vector<double>& values)
{
	cr->save();

	cr->rectangle(m_left, m_top, m_right - m_left, m_bottom - m_top);
	cr->clip();

	cr->move_to(FrequencyToPosition(freqs[0]), ValueToPosition(values[0]));
	for(size_t i=1; i<values.size(); i++)
		cr->line_to(FrequencyToPosition(freqs[i]), ValueToPosition(values[i]));
	cr->stroke();

	cr->restore();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Text helpers

static Pango::FontDescription GetFont(bool bBig)
{
	Pango::FontDescription font(bBig ? "sans normal 12" : "sans normal 9");
	font.set_weight(bBig ? Pango::WEIGHT_BOLD : Pango::WEIGHT_NORMAL);
	return font;
}

void BodePlotRenderer::GetStringWidth(
	const Cairo::RefPtr<Cairo::Context>& cr,
	const string& str,
	bool bBig,
	int& width,
	int& height)
{
	Glib::RefPtr<Pango::Layout> tlayout = Pango::Layout::create(cr);
	tlayout->set_font_description(GetFont(bBig));
	tlayout->set_text(str);
	tlayout->get_pixel_size(width, height);
}

void BodePlotRenderer::DrawString(float x, float y, const Cairo::RefPtr<Cairo::Context>& cr, const string& str, bool bBig)
{
	cr->save();

		Glib::RefPtr<Pango::Layout> tlayout = Pango::Layout::create(cr);
		tlayout->set_font_description(GetFont(bBig));
		tlayout->set_text(str);

		cr->move_to(x, y);
		tlayout->update_from_cairo_context(cr);
		tlayout->show_in_cairo_context(cr);

	cr->restore();
}

void BodePlotRenderer::DrawStringVertical(float x, float y, const Cairo::RefPtr<Cairo::Context>& cr, const string& str)
{
	cr->save();

		Glib::RefPtr<Pango::Layout> tlayout = Pango::Layout::create(cr);
		tlayout->set_font_description(GetFont(false));
		tlayout->set_text(str);

		Pango::Rectangle ink, logical;
		tlayout->get_extents(ink, logical);

		float delta = (logical.get_width()/2) / Pango::SCALE;
		cr->move_to(x, y + delta);
		cr->rotate(- M_PI / 2);

		tlayout->update_from_cairo_context(cr);
		tlayout->show_in_cairo_context(cr);

	cr->restore();
}
