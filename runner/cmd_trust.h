#pragma once

int cmd_trust(int argc, char** argv);
int cmd_notes(int argc, char** argv);
int cmd_files(int argc, char** argv);
int cmd_flags(int argc, char** argv);
