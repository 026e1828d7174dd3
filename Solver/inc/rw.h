#pragma once

class Model;

class ReadWrite
{
private:
   std::string paramFile, windFarmFile, hubFile, substationFile;
   std::string inputDirectory, outputDirectory;

   static double toDouble(const std::string &_value, const std::string &_file, int _row);
   static int toInt(const std::string &_value, const std::string &_file, int _row);
   int countryOf(const std::string &_iso, const std::string &_file, int _row) const;
   std::vector< std::pair<int, std::vector<std::string> > > readTable(const std::string &_file, int _numCols) const;
   std::string outputPath(const Model &_model, const std::string &_suffix) const;

public:
   ReadWrite() {
      paramFile = "/Parameters.dat";
      windFarmFile = "/wf_data.csv";
      hubFile = "/eh_data.csv";
      substationFile = "/onss_data.csv";
   };

   void readParameters(Model &_model);
   bool applySwitch(Model &_model, const std::string &_flag) const;		// command-line model switches
   void readSystemData(Model &_model);
   std::vector<WindFarm> readWindFarms() const;
   std::vector<EnergyHub> readHubs() const;
   std::vector<Substation> readSubstations() const;

   void writeRunMetadata(const Model &_model);
   void writeStageResult(const Model &_model, const StageResult &_res);

   std::vector<std::string> split(const std::string &s, char delim = ',') const;

   void set_inputDirectory(const std::string &_inputDir) { inputDirectory = _inputDir; }
   void set_outputDirectory(const std::string &_outputDir) { outputDirectory = _outputDir; }
   std::string get_inputDirectory() const { return inputDirectory; }
   std::string get_outputDirectory() const { return outputDirectory; }
};
