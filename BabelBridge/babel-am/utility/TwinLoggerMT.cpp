/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.

	Based on: Vili Petek's theread safe simple logger (http://www.vilipetek.com)
*/

/*See decription in the header file*/

#include "TwinLoggerMT.h"
#include <chrono>

#include "Utility.h"

namespace twinLogger {

	TwinLoggerMT::TwinLoggerMT() : m_maxSizeMB(10), m_nMinLevel(Info)
	{
	}

	void TwinLoggerMT::init(std::string filename, bool bAppend, int maxsize)
	{
		m_maxSizeMB = maxsize;
		if (m_maxSizeMB < 1) m_maxSizeMB = 1;
		openlog(filename, bAppend);
	}

	//returns the highest index found for 'stem_N.ext' log files in the log directory (0 if none)
	static int FindLastLogIndex(const fs::path & logfile)
	{
		fs::path dir(logfile.parent_path());
		if (dir.empty()) dir = ".";
		if (!fs::exists(dir)) return 0;
		std::string stem = logfile.stem().string();
		std::string ext = logfile.extension().string();
		boost::regex rexp("^" + RegexEscape(stem) + "_([0-9]+)" + RegexEscape(ext) + "$");
		std::vector<fs::path> logs;
		GetAllMatchingFiles(logs, dir, rexp);
		int n = 0;
		for (fs::path p : logs) {
			boost::smatch m;
			std::string fn = p.filename().string();
			if (boost::regex_match(fn, m, rexp)) {
				int nn = std::stoi(m[1].str());
				if (nn > n) n = nn;
			}
		}
		return n;
	}

	void TwinLoggerMT::openlog(std::string filename, bool bAppend)
	{
		std::lock_guard<std::mutex> lock(m_oMutex);
		if (m_oFile.is_open()) {
			m_oFile.flush();
			m_oFile.close();
		}

		fs::path f(filename);
		try {
			if (f.has_parent_path() && !fs::exists(f.parent_path()))
				fs::create_directories(f.parent_path());

			//in case the log file is becoming too big then continue in a new one
			if (bAppend && fs::exists(f))
			{
				int n = FindLastLogIndex(f);
				fs::path last(f);
				if (n > 0) last = f.parent_path() / (f.stem().string() + "_" + std::to_string(n) + f.extension().string());
				uintmax_t szMB = fs::file_size(last) / 1024 / 1024;
				if (szMB >= (uintmax_t)m_maxSizeMB)
					last = f.parent_path() / (f.stem().string() + "_" + std::to_string(n + 1) + f.extension().string());
				f = last;
			}

			if (bAppend)
				m_oFile.open(f.string(), std::fstream::out | std::fstream::app | std::fstream::ate);
			else
				m_oFile.open(f.string(), std::fstream::out);
		}
		catch (const std::exception& ex)
		{
			//NOTE: the logger will only write to std::cout
			std::cerr << "ERROR: could not open log file " << f.string() << " (" << ex.what() << ")\n";
		}
	}

	TwinLoggerMT::~TwinLoggerMT()
	{
		if (m_oFile.is_open()) {
			m_oFile.flush();
			m_oFile.close();
		}
	}

	LogStream TwinLoggerMT::operator()()
	{
		return LogStream(*this, Info, "");
	}

	LogStream TwinLoggerMT::operator()(Level nLevel)
	{
		return LogStream(*this, nLevel, "");
	}

	LogStream TwinLoggerMT::operator()(Level nLevel, std::string filename, int linenumber)
	{
		std::string extrainfo("File: " + filename + ", Line: " + std::to_string(linenumber));
		return LogStream(*this, nLevel, extrainfo);
	}

	const tm* TwinLoggerMT::getLocalTime()
	{
		auto in_time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
		localtime_r(&in_time_t, &m_oLocalTime);
		return &m_oLocalTime;
	}

	// "YYYY-mm-DD HH:MM:SS"
	static std::ostream& operator<< (std::ostream& stream, const tm* tm)
	{
		return stream << std::put_time(tm, "%Y-%m-%d %H:%M:%S");
	}

	//NOTE: logging is more detailed in the log file than on std::cout
	//		If the log file is not open it will write only to std::cout
	void TwinLoggerMT::log(Level nLevel, std::string oMessage, std::string extraInfo)
	{
		const static char* LevelStr[] = { "DEBUG", "INFO", "WARNING", "ERROR", "FATAL ERROR" };
		if (nLevel < m_nMinLevel) return;

		std::lock_guard<std::mutex> lock(m_oMutex);

		//only new line characters: output the new lines without headings
		std::string s(oMessage);
		ReplaceStringInPlace(s, "\n", "");
		boost::algorithm::trim(s);
		if (s == "") {
			if (m_oFile.is_open())
				m_oFile << oMessage;
			std::cout << oMessage;
			return;
		}

		if (m_oFile.is_open()) {
			m_oFile << '[' << getLocalTime() << ']' << '[' << LevelStr[nLevel] << "]\t" << oMessage << std::endl;
			if (extraInfo != "") m_oFile << extraInfo << std::endl;
		}
		std::cout << '[' << LevelStr[nLevel] << "]\t" << oMessage << std::endl;
		if (extraInfo != "") std::cout << extraInfo << std::endl;
	}

	LogStream::LogStream(TwinLoggerMT& oLogger, Level nLevel, std::string extraInfo) :
		m_oLogger(oLogger), m_nLevel(nLevel), m_extraInfo(extraInfo)
	{
	}
	LogStream::LogStream(const LogStream& ls) :
		std::ostringstream(), m_oLogger(ls.m_oLogger), m_nLevel(ls.m_nLevel), m_extraInfo(ls.m_extraInfo)
	{
	}
	LogStream::~LogStream()
	{
		m_oLogger.log(m_nLevel, str(), m_extraInfo);
	}
}
