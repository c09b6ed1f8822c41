#pragma once

int cmd_hash(int argc, char** argv);
int cmd_check(int argc, char** argv);
