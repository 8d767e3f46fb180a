#include <stdlib.h>		//for strtoul,strtol,exit
#include <unistd.h>		//for getopt
#include <signal.h>
#include <sys/stat.h>	//for stat
#include <iostream>
#include <string>

#include "../lib/xfer.h"
#include "../lib/receiver.h"

using namespace std;

static StopToken stoptoken;
static bool midline = false;

void catchtermination(int signal)
{
	stoptoken.stop();
}

static void printprogress(double percentage, const string &message)
{
	cout<<"\r"<<message<<flush;
	midline = true;
}

static void printstatus(const string &message)
{
	if(midline)
	{
		cout<<endl;
		midline = false;
	}
	cout<<message<<endl;
}

static void usage(const char *prog)
{
	cerr<<"usage: "<<prog<<" [-d savedir] [-t pollms] <hostaddr> <port>\n";
}

int main(int argc, char **argv)
{
	XferConfig config;
	int opt;
	char *end;
	while((opt = getopt(argc, argv, "d:t:h")) != -1)
	{
		switch(opt)
		{
			case 'd':
				config.savedir = optarg;
				break;
			case 't':
			{
				long pollms = strtol(optarg, &end, 10);
				if(*optarg == '\0' || *end != '\0' || pollms <= 0 || pollms > 60000)
				{
					cerr<<"ERROR invalid poll interval: "<<optarg<<endl;
					exit(1);
				}
				config.pollinterval = (int)pollms;
				break;
			}
			case 'h':
				usage(argv[0]);
				exit(0);
			default:
				usage(argv[0]);
				exit(1);
		}
	}

	if(argc - optind != 2)
	{
		usage(argv[0]);
		exit(1);
	}

	struct stat dirstat;
	if(stat(config.savedir.c_str(), &dirstat) < 0 || !S_ISDIR(dirstat.st_mode))
	{
		cerr<<"ERROR save directory does not exist: "<<config.savedir<<endl;
		exit(1);
	}

	string hostname = argv[optind];
	unsigned long portno = strtoul(argv[optind + 1], &end, 10);
	if(*end != '\0' || portno > 65535)
	{
		cerr<<"ERROR invalid port number: "<<argv[optind + 1]<<endl;
		exit(1);
	}

	signal(SIGINT, catchtermination);
	signal(SIGTERM, catchtermination);

	XferCallbacks callbacks;
	callbacks.onprogress = printprogress;
	callbacks.onstatus = printstatus;

	FileReceiver receiver(config, callbacks);
	if(!receiver.listen(hostname, (unsigned short)portno, stoptoken))
		return 1;

	cout<<"\n\nServer Stopped"<<endl;
	return 0;
}
