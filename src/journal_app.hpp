#pragma once

/// CLI entry:
///   trip_journal curate <photo_manifest> <trip_id> [output.yml]
///   trip_journal replay <track_file> <trip_id> [output.yml]
int runJournalApplication(int argc, char **argv);
