/******************************************************************************\
 * FakeFleet.hpp - Scripted in-memory machines answering the shell commands
 *                 issued by the listing, compare and copy code.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <stdint.h>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "remote/RemoteSession.hpp"

/*
** Each fake machine holds a tree of directories and sized files. Listings are
** rendered in the long format the parser expects. Listeners, named pipes and
** transfers are simulated so copy chains can run end to end: a send copies
** the requested entries into every machine listening on the port.
*/
class FakeFleet : public fleet::SessionFactory
{
public: // types
	struct Machine
	{
		std::set<std::string> directories;
		std::map<std::string, uint64_t> files;
		std::set<std::string> pipes;
		std::map<int, std::string> listeners; // port -> extraction directory
		std::set<std::string> missingTools;
		std::vector<std::string> commands;
		int cores = 4;

		bool neverListens = false;            // listener commands never come up
		bool dropReceivedFiles = false;       // received entries are not written
	};

private: // types
	struct State
	{
		mutable std::mutex lock;
		std::condition_variable changed;
		std::map<std::string, Machine> machines;
		std::vector<std::string> events;
		std::chrono::milliseconds readyWait{2000};

		std::string run(std::string const& address, std::string const& command);
	};

	class Session;

private: // variables
	std::shared_ptr<State> m_state;

public: // setup
	void addDirectory(std::string const& address, std::string const& path);
	void addFile(std::string const& address, std::string const& path, uint64_t size);
	void removeTool(std::string const& address, std::string const& tool);
	void setNeverListens(std::string const& address);
	void setDropReceivedFiles(std::string const& address);
	void setReadyWait(std::chrono::milliseconds wait);

public: // inspection
	// readiness confirmations and sends, in order
	std::vector<std::string> getEvents() const;
	std::vector<std::string> getCommands(std::string const& address) const;
	bool hasFile(std::string const& address, std::string const& path, uint64_t size) const;

public: // inherited interface
	std::unique_ptr<fleet::RemoteSession> open(std::string const& address) override;

public: // Constructor/destructors
	FakeFleet();
	virtual ~FakeFleet() = default;
};
