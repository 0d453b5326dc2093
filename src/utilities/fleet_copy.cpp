/******************************************************************************\
 * fleet_copy.cpp - Copy a directory tree from one host to several through a
 *                  relay chain, or verify a previous copy.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <iostream>
#include <string>
#include <tuple>
#include <vector>

#include "remote/HostRegistry.hpp"

const struct option long_opts[] = {
			{"source",		required_argument,	0, 's'},
			{"target",		required_argument,	0, 't'},
			{"file",		required_argument,	0, 'f'},
			{"port",		required_argument,	0, 'p'},
			{"overwrite",	no_argument,		0, 'o'},
			{"verify-only",	no_argument,		0, 'v'},
			{"help",		no_argument,		0, 'h'},
			{0, 0, 0, 0}
			};

static void
usage(char *name)
{
	fprintf(stdout, "Usage: %s --source HOST:DIR --target HOST[:DIR] [OPTIONS]...\n", name);
	fprintf(stdout, "Copy DIR from the source host to every target host through a relay chain.\n\n");

	fprintf(stdout, "\t-s, --source       source host and base directory\n");
	fprintf(stdout, "\t-t, --target       destination host, optionally with its own directory.\n");
	fprintf(stdout, "\t                   Repeat for each destination, in chain order\n");
	fprintf(stdout, "\t-f, --file         copy only this entry below DIR. May be repeated\n");
	fprintf(stdout, "\t-p, --port         transport port (default $" FLEET_COPY_PORT_ENV_VAR " or %d)\n",
		FLEET_DEFAULT_COPY_PORT);
	fprintf(stdout, "\t-o, --overwrite    allow nonempty destination entries\n");
	fprintf(stdout, "\t-v, --verify-only  only compare the destinations against the source\n");
	fprintf(stdout, "\t-h, --help         Display this text and exit\n\n");

	fprintf(stdout, "Remote access is configured through the FLEET_SSH_* environment variables.\n");
}

int
main(int argc, char **argv)
{
	std::string sourceArg;
	std::vector<std::string> targetArgs;
	auto options = fleet::CopyOptions{};
	bool verifyOnly = false;

	{ // parse options using getopt
		int opt_ind = 0;
		int c;

		if (argc < 2)
		{
			usage(argv[0]);
			return 1;
		}

		while ((c = getopt_long(argc, argv, "s:t:f:p:ovh", long_opts, &opt_ind)) != -1)
		{
			switch (c)
			{
				case 0:
					// if this is a flag, do nothing
					break;

				case 's':
					sourceArg = std::string(optarg);
					break;

				case 't':
					targetArgs.emplace_back(optarg);
					break;

				case 'f':
					options.files.emplace_back(optarg);
					break;

				case 'p':
				{
					char *end = nullptr;
					auto const port = strtol(optarg, &end, 10);
					if ((end == optarg) || (*end != '\0') || (port < 1) || (port > 65535))
					{
						fprintf(stderr, "Invalid port: %s\n", optarg);
						return 1;
					}
					options.port = static_cast<int>(port);
					break;
				}

				case 'o':
					options.overwrite = true;
					break;

				case 'v':
					verifyOnly = true;
					break;

				case 'h':
					usage(argv[0]);
					return 0;

				default:
					usage(argv[0]);
					return 1;
			}
		}

		if (sourceArg.empty() || targetArgs.empty())
		{
			fprintf(stderr, "Missing source or target argument.\n");
			return 1;
		}
	}

	try {
		auto registry = fleet::HostRegistry::fromEnvironment();

		std::string sourceHost, baseDir;
		std::tie(sourceHost, baseDir) = fleet::parseHostDirectory(sourceArg);
		if (baseDir.empty()) {
			throw std::invalid_argument("Source must be given as HOST:DIR");
		}
		auto source = registry->resolve(sourceHost);

		auto targets = std::vector<fleet::CopyTarget>{};
		for (auto&& targetArg : targetArgs) {
			std::string targetHost, targetDir;
			std::tie(targetHost, targetDir) = fleet::parseHostDirectory(targetArg);
			targets.emplace_back(registry->resolve(targetHost), targetDir);
		}

		if (verifyOnly) {
			source->compareTrees(baseDir, targets, options);
			std::cout << "Verified " << targets.size() << " destination(s) against "
				<< source->toString() << ":" << baseDir << std::endl;
		} else {
			source->copyChain(baseDir, targets, options);
			std::cout << "Copied " << source->toString() << ":" << baseDir << " to "
				<< targets.size() << " destination(s)" << std::endl;
		}

	} catch (std::exception const& ex) {
		fprintf(stderr, "%s\n", ex.what());
		return 1;
	}

	return 0;
}
